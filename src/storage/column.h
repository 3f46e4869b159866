#ifndef CLAIMSTONE_SRC_STORAGE_COLUMN_H_
#define CLAIMSTONE_SRC_STORAGE_COLUMN_H_

#include <cstdint>
#include <string>
#include <vector>

namespace Claimstone {

struct ColumnFamily {
	std::string name;

	bool operator==(const ColumnFamily& other) const { return name == other.name; }
};

// A single cell. Deletes are stored as tombstones so that they take part in
// last-write-wins resolution against older puts on other replicas.
struct Column {
	std::string name;
	std::string value;
	uint64_t timestamp_us = 0;
	int ttl_seconds = 0;  // 0 means no expiry
	bool deleted = false;

	bool HasExpired(uint64_t now_us) const {
		return ttl_seconds > 0 &&
			now_us >= timestamp_us + static_cast<uint64_t>(ttl_seconds) * 1000000ULL;
	}

	bool IsLive(uint64_t now_us) const {
		return !deleted && !HasExpired(now_us);
	}

	// True if this version wins over |other| for the same column name.
	// Ties go to the tombstone, then to the greater value.
	bool Supersedes(const Column& other) const {
		if (timestamp_us != other.timestamp_us) {
			return timestamp_us > other.timestamp_us;
		}
		if (deleted != other.deleted) {
			return deleted;
		}
		return value > other.value;
	}
};

using ColumnSlice = std::vector<Column>;

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_STORAGE_COLUMN_H_
