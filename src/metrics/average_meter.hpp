#ifndef __AVERAGE_METER_HPP
#define __AVERAGE_METER_HPP

#include <cstdint>

enum class Direction {
	LOWER_IS_BETTER, HIGHER_IS_BETTER
};

// Running average of one statistic within a phase, plus the best average
// seen over all epochs. Reset() starts a new epoch and keeps the best.
class AverageMeter {
public:
	explicit AverageMeter(Direction direction = Direction::LOWER_IS_BETTER);

	void Update(float fValue, uint64_t nCount = 1);

	// True only if the current average strictly beats the stored best.
	bool UpdateBest();

	void Reset();

	float Value() const {
		return m_fValue;
	}
	uint64_t Count() const {
		return m_nCount;
	}
	float Average() const;
	float Best() const {
		return m_fBest;
	}
	bool HasBest() const {
		return m_bHasBest;
	}
	Direction GetDirection() const {
		return m_Direction;
	}

private:
	Direction m_Direction;
	float m_fValue = 0.f;
	double m_dSum = 0.0;
	uint64_t m_nCount = 0;
	float m_fBest = 0.f;
	bool m_bHasBest = false;
};

#endif // #ifndef __AVERAGE_METER_HPP
