#include <cmath>
#include "average_meter.hpp"

AverageMeter::AverageMeter(Direction direction)
	: m_Direction(direction) {
}

void AverageMeter::Update(float fValue, uint64_t nCount) {
	m_fValue = fValue;
	m_dSum += static_cast<double>(fValue) * nCount;
	m_nCount += nCount;
}

float AverageMeter::Average() const {
	if (m_nCount == 0) {
		return 0.f;
	}
	return static_cast<float>(m_dSum / m_nCount);
}

bool AverageMeter::UpdateBest() {
	if (m_nCount == 0) {
		return false;
	}
	float fAvg = Average();
	if (std::isnan(fAvg)) {
		return false;
	}
	bool bImproved = !m_bHasBest;
	if (m_bHasBest) {
		bImproved = m_Direction == Direction::LOWER_IS_BETTER
				? fAvg < m_fBest : fAvg > m_fBest;
	}
	if (bImproved) {
		m_fBest = fAvg;
		m_bHasBest = true;
	}
	return bImproved;
}

void AverageMeter::Reset() {
	m_fValue = 0.f;
	m_dSum = 0.0;
	m_nCount = 0;
}
