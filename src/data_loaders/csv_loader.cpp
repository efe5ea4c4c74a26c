#include <fstream>
#include <glog/logging.h>
#include "../argman.hpp"
#include "../creator.hpp"
#include "../errors.hpp"
#include "../utils.hpp"
#include "batch_loader.hpp"

// One sample per CSV row: feature columns plus an optional label column.
// With seq_len > 0 the features of a row are laid out as
// [feature, time] = [F / seq_len, seq_len].
class CSVLoader final : public BatchLoader {
public:
	~CSVLoader() override {
		try {
			_JoinWorker();
		} catch (const std::exception &e) {
			LOG(ERROR) << "Pending batch failed: " << e.what();
		}
	}

	void Initialize(const nlohmann::json &jConf) override {
		BatchLoader::Initialize(jConf);

		ArgMan argMan;
		Arg<std::string> argPath("path", ARG_REQUIRED, argMan);
		Arg<bool> argHeader("header", false, argMan);
		Arg<bool> argLabeled("labeled", true, argMan);
		Arg<int32_t> argLabelColumn("label_column", -1, argMan);
		Arg<uint64_t> argSeqLen("seq_len", 0, argMan);
		Arg<std::string> argDelimiter("delimiter", ",", argMan);
		ParseArgsFromJson(jConf, argMan);

		if (argDelimiter().size() != 1) {
			throw ConfigurationError("delimiter must be a single character");
		}
		m_bLabeled = argLabeled();
		m_nSeqLen = argSeqLen();
		__ReadFile(argPath(), argHeader(), argLabelColumn(), argDelimiter()[0]);
	}

	uint64_t Size() const override {
		return m_nRows;
	}

	INPUT_SHAPE GetInputShape() const override {
		INPUT_SHAPE shape;
		shape.nFeatureSize = m_nSeqLen > 0 ? m_nCols / m_nSeqLen : m_nCols;
		shape.nSeqLen = m_nSeqLen;
		shape.nBatchNormSize = shape.nFeatureSize;
		return shape;
	}

	bool HasTargets() const override {
		return m_bLabeled;
	}

protected:
	void _LoadBatch(const std::vector<uint64_t> &indices,
			torch::Tensor &tData, torch::Tensor &tTarget) override {
		CHECK(!indices.empty());
		const int64_t nBatch = indices.size();
		torch::Tensor tBatch = torch::empty({nBatch, (int64_t)m_nCols});
		float *pBatch = tBatch.data_ptr<float>();
		for (int64_t i = 0; i < nBatch; ++i) {
			CHECK_LT(indices[i], m_nRows);
			std::copy_n(m_Features.begin() + indices[i] * m_nCols, m_nCols,
					pBatch + i * m_nCols);
		}
		if (m_nSeqLen > 0) {
			tBatch = tBatch.reshape({nBatch, (int64_t)(m_nCols / m_nSeqLen),
					(int64_t)m_nSeqLen});
		}
		tData = tBatch;
		if (m_bLabeled) {
			tTarget = torch::empty({nBatch});
			float *pTarget = tTarget.data_ptr<float>();
			for (int64_t i = 0; i < nBatch; ++i) {
				pTarget[i] = m_Labels[indices[i]];
			}
		} else {
			tTarget = torch::Tensor();
		}
	}

private:
	void __ReadFile(const std::string &strPath, bool bHeader,
			int32_t nLabelColumn, char delim) {
		std::ifstream inFile(strPath);
		if (!inFile.is_open()) {
			throw ConfigurationError("cannot open data file \"" + strPath + "\"");
		}
		std::string strLine;
		if (bHeader) {
			std::getline(inFile, strLine);
		}
		for (uint64_t nLine = bHeader ? 2 : 1; std::getline(inFile, strLine);
				++nLine) {
			if (!strLine.empty() && strLine.back() == '\r') {
				strLine.pop_back();
			}
			if (strLine.empty()) {
				continue;
			}
			auto fields = SplitString(strLine, delim);
			int64_t nLabelIdx = -1;
			if (m_bLabeled) {
				nLabelIdx = nLabelColumn < 0
						? (int64_t)fields.size() + nLabelColumn : nLabelColumn;
				if (nLabelIdx < 0 || nLabelIdx >= (int64_t)fields.size()) {
					throw ConfigurationError(strPath + ":" + std::to_string(nLine)
							+ ": label column out of range");
				}
			}
			uint64_t nCols = 0;
			for (int64_t i = 0; i < (int64_t)fields.size(); ++i) {
				float fVal = __ToFloat(fields[i], strPath, nLine);
				if (i == nLabelIdx) {
					m_Labels.push_back(fVal);
				} else {
					m_Features.push_back(fVal);
					++nCols;
				}
			}
			if (m_nRows == 0) {
				m_nCols = nCols;
			} else if (nCols != m_nCols) {
				throw ConfigurationError(strPath + ":" + std::to_string(nLine)
						+ ": expected " + std::to_string(m_nCols) + " features");
			}
			++m_nRows;
		}
		if (m_nSeqLen > 0 && m_nCols % m_nSeqLen != 0) {
			throw ConfigurationError(strPath + ": feature count "
					+ std::to_string(m_nCols) + " is not a multiple of seq_len");
		}
		LOG(INFO) << "Loaded " << m_nRows << " rows of " << m_nCols
				  << " features from " << strPath;
	}

	static float __ToFloat(const std::string &strField,
			const std::string &strPath, uint64_t nLine) {
		size_t nUsed = 0;
		float fVal = 0.f;
		try {
			fVal = std::stof(strField, &nUsed);
		} catch (const std::logic_error&) {
			throw ConfigurationError(strPath + ":" + std::to_string(nLine)
					+ ": \"" + strField + "\" is not a number");
		}
		if (nUsed != strField.size()) {
			throw ConfigurationError(strPath + ":" + std::to_string(nLine)
					+ ": \"" + strField + "\" is not a number");
		}
		return fVal;
	}

private:
	bool m_bLabeled = true;
	uint64_t m_nSeqLen = 0;
	uint64_t m_nRows = 0;
	uint64_t m_nCols = 0;
	std::vector<float> m_Features;
	std::vector<float> m_Labels;
};

REGISTER_CREATOR(BatchLoader, CSVLoader, "CSV");
