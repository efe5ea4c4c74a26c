#include "types.hpp"

const std::string& PhaseName(Phase phase) {
	static const std::string names[] = {"train", "val", "test", "infer"};
	return names[static_cast<int>(phase)];
}

const std::string& TaskTypeName(TaskType taskType) {
	static const std::string names[] = {"classify", "regress"};
	return names[static_cast<int>(taskType)];
}
