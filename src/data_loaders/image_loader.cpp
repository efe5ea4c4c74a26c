#include <fstream>
#include <sstream>
#include <boost/filesystem.hpp>
#include <glog/logging.h>
#include <opencv2/opencv.hpp>
#include "../argman.hpp"
#include "../creator.hpp"
#include "../errors.hpp"
#include "batch_loader.hpp"

namespace bfs = boost::filesystem;

// Images listed in a text file, one "<path> [label]" per line. Relative
// paths resolve against data_root. Every image is resized to height x width.
class ImageLoader final : public BatchLoader {
public:
	~ImageLoader() override {
		try {
			_JoinWorker();
		} catch (const std::exception &e) {
			LOG(ERROR) << "Pending batch failed: " << e.what();
		}
	}

	void Initialize(const nlohmann::json &jConf) override {
		BatchLoader::Initialize(jConf);

		ArgMan argMan;
		Arg<std::string> argImageList("image_list", ARG_REQUIRED, argMan);
		Arg<std::string> argDataRoot("data_root", "", argMan);
		Arg<uint64_t> argHeight("height", ARG_REQUIRED, argMan);
		Arg<uint64_t> argWidth("width", ARG_REQUIRED, argMan);
		Arg<uint64_t> argChannels("channels", 3, argMan);
		Arg<bool> argLabeled("labeled", true, argMan);
		ParseArgsFromJson(jConf, argMan);

		m_OutSize = cv::Size(argWidth(), argHeight());
		if (m_OutSize.area() <= 0) {
			throw ConfigurationError("image height and width must be positive");
		}
		m_nChannels = argChannels();
		if (m_nChannels != 1 && m_nChannels != 3) {
			throw ConfigurationError("channels must be 1 or 3");
		}
		m_bLabeled = argLabeled();

		std::ifstream listFile(argImageList());
		if (!listFile.is_open()) {
			throw ConfigurationError("cannot open image list \""
					+ argImageList() + "\"");
		}
		bfs::path dataRoot(argDataRoot());
		for (std::string strLine; std::getline(listFile, strLine); ) {
			std::istringstream iss(strLine);
			std::string strPath;
			if (!(iss >> strPath)) {
				continue;
			}
			float fLabel = 0.f;
			if (m_bLabeled && !(iss >> fLabel)) {
				throw ConfigurationError("no label for \"" + strPath + "\" in "
						+ argImageList());
			}
			bfs::path imagePath(strPath);
			if (imagePath.is_relative() && !dataRoot.empty()) {
				imagePath = dataRoot / imagePath;
			}
			m_ImgList.emplace_back(imagePath.string());
			m_Labels.push_back(fLabel);
		}
		LOG(INFO) << "Listed " << m_ImgList.size() << " images from "
				  << argImageList();
	}

	uint64_t Size() const override {
		return m_ImgList.size();
	}

	INPUT_SHAPE GetInputShape() const override {
		INPUT_SHAPE shape;
		shape.nChannels = m_nChannels;
		shape.nImageHeight = m_OutSize.height;
		shape.nImageWidth = m_OutSize.width;
		shape.nFeatureSize = m_nChannels * m_OutSize.area();
		shape.nBatchNormSize = m_nChannels;
		return shape;
	}

	bool HasTargets() const override {
		return m_bLabeled;
	}

protected:
	void _LoadBatch(const std::vector<uint64_t> &indices,
			torch::Tensor &tData, torch::Tensor &tTarget) override {
		TENSOR_ARY images;
		std::vector<float> labels;
		const int nReadFlag = m_nChannels == 1
				? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;
		for (auto nIdx : indices) {
			CHECK_LT(nIdx, m_ImgList.size());
			cv::Mat img = cv::imread(m_ImgList[nIdx], nReadFlag);
			if (img.empty()) {
				throw UnitrainError("cannot decode image \"" + m_ImgList[nIdx] + "\"");
			}
			cv::resize(img, img, m_OutSize);
			if (m_nChannels == 3) {
				cv::cvtColor(img, img, cv::COLOR_BGR2RGB);
			}
			img.convertTo(img, CV_32F, 1.f / 255);

			auto tImage = torch::from_blob(img.data, {1, m_OutSize.height,
					m_OutSize.width, (int64_t)m_nChannels});
			images.emplace_back(tImage.permute({0, 3, 1, 2}).clone());
			labels.push_back(m_Labels[nIdx]);
		}
		tData = torch::cat(images);
		if (m_bLabeled) {
			tTarget = torch::tensor(labels, torch::kFloat);
		} else {
			tTarget = torch::Tensor();
		}
	}

private:
	cv::Size m_OutSize;
	uint64_t m_nChannels = 3;
	bool m_bLabeled = true;
	std::vector<std::string> m_ImgList;
	std::vector<float> m_Labels;
};

REGISTER_CREATOR(BatchLoader, ImageLoader, "IMAGE");
