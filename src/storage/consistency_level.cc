#include "consistency_level.h"

#include <stdexcept>
#include <unordered_map>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "../common/exceptions.h"

namespace Claimstone {

ConsistencyLevel parseConsistencyLevel(const std::string& value) {
	static const std::unordered_map<std::string, ConsistencyLevel> levelMap = {
		{"ANY", ConsistencyLevel::ANY},
		{"ONE", ConsistencyLevel::ONE},
		{"TWO", ConsistencyLevel::TWO},
		{"THREE", ConsistencyLevel::THREE},
		{"QUORUM", ConsistencyLevel::QUORUM},
		{"LOCAL_QUORUM", ConsistencyLevel::LOCAL_QUORUM},
		{"EACH_QUORUM", ConsistencyLevel::EACH_QUORUM},
		{"ALL", ConsistencyLevel::ALL},
		{"LOCAL_ONE", ConsistencyLevel::LOCAL_ONE}
	};

	std::string name = absl::AsciiStrToUpper(value);
	if (absl::StartsWith(name, "CL_")) {
		name = name.substr(3);
	}

	auto it = levelMap.find(name);
	if (it != levelMap.end()) {
		return it->second;
	}

	LOG(ERROR) << "Invalid ConsistencyLevel: " << value;
	throw std::invalid_argument("Invalid ConsistencyLevel: " + value);
}

std::string ConsistencyLevelName(ConsistencyLevel level) {
	switch (level) {
		case ConsistencyLevel::ANY: return "ANY";
		case ConsistencyLevel::ONE: return "ONE";
		case ConsistencyLevel::TWO: return "TWO";
		case ConsistencyLevel::THREE: return "THREE";
		case ConsistencyLevel::QUORUM: return "QUORUM";
		case ConsistencyLevel::LOCAL_QUORUM: return "LOCAL_QUORUM";
		case ConsistencyLevel::EACH_QUORUM: return "EACH_QUORUM";
		case ConsistencyLevel::ALL: return "ALL";
		case ConsistencyLevel::LOCAL_ONE: return "LOCAL_ONE";
	}
	return "UNKNOWN";
}

int RequiredReplicas(ConsistencyLevel level, int replication_factor) {
	int required = 0;
	switch (level) {
		case ConsistencyLevel::ANY:
		case ConsistencyLevel::ONE:
		case ConsistencyLevel::LOCAL_ONE:
			required = 1;
			break;
		case ConsistencyLevel::TWO:
			required = 2;
			break;
		case ConsistencyLevel::THREE:
			required = 3;
			break;
		// Single data centre: every quorum flavour is a majority of the replicas.
		case ConsistencyLevel::QUORUM:
		case ConsistencyLevel::LOCAL_QUORUM:
		case ConsistencyLevel::EACH_QUORUM:
			required = replication_factor / 2 + 1;
			break;
		case ConsistencyLevel::ALL:
			required = replication_factor;
			break;
	}

	if (replication_factor < 1 || required > replication_factor) {
		throw StorageException(absl::StrCat("Consistency level ", ConsistencyLevelName(level),
					" needs ", required, " replicas but replication factor is ", replication_factor));
	}
	return required;
}

} // namespace Claimstone
