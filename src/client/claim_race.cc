#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../common/configuration.h"
#include "../common/exceptions.h"
#include "../storage/clock.h"
#include "../storage/replicated_keyspace.h"
#include "../uniqueness/uniqueness_coordinator.h"

using namespace Claimstone;

namespace {

enum class Outcome {
	COMMITTED,
	NOT_UNIQUE,
	STORAGE_FAILURE
};

const char* OutcomeName(Outcome outcome) {
	switch (outcome) {
		case Outcome::COMMITTED: return "committed";
		case Outcome::NOT_UNIQUE: return "not unique";
		case Outcome::STORAGE_FAILURE: return "storage failure";
	}
	return "unknown";
}

struct ClaimResult {
	std::vector<std::string> rows;
	std::string token;
	Outcome outcome = Outcome::STORAGE_FAILURE;
	std::string detail;
};

std::string RowKey(int index) {
	return absl::StrCat("identity-", index);
}

// Every row may carry at most one committed claim, and a committed attempt
// must own all of its rows.
bool AuditClaims(ReplicatedKeyspace& keyspace, const ColumnFamily& column_family,
		const UniquenessOptions& defaults, int num_rows, const std::vector<ClaimResult>& results) {
	bool ok = true;
	absl::flat_hash_map<std::string, std::string> owner_by_row;

	for (int i = 0; i < num_rows; ++i) {
		std::string row = RowKey(i);
		int committed = 0;
		for (const auto& column : keyspace.ReadRow(column_family, row, defaults.column_prefix,
					defaults.consistency_level)) {
			if (ColumnPrefixRowLock::DecodeExpiry(column.value) == 0) {
				committed++;
				owner_by_row[row] = column.name.substr(defaults.column_prefix.size());
			}
		}
		if (committed > 1) {
			LOG(ERROR) << "Row " << row << " carries " << committed << " committed claims";
			ok = false;
		}
	}

	for (const auto& result : results) {
		if (result.outcome != Outcome::COMMITTED) {
			continue;
		}
		for (const auto& row : result.rows) {
			auto it = owner_by_row.find(row);
			if (it == owner_by_row.end() || it->second != result.token) {
				LOG(ERROR) << "Committed attempt " << result.token << " does not own row " << row;
				ok = false;
			}
		}
	}
	return ok;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("claimstone_race", "Races concurrent multi-row uniqueness claims");

	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>()->default_value(""))
		("c,claimants", "Number of concurrent claimants", cxxopts::value<int>()->default_value("8"))
		("r,rows", "Number of distinct row keys", cxxopts::value<int>()->default_value("16"))
		("k,rows_per_claim", "Rows each claimant tries to claim", cxxopts::value<int>()->default_value("3"))
		("t,ttl", "Probe TTL in seconds, overrides the configuration", cxxopts::value<int>())
		("consistency", "Consistency level, overrides the configuration", cxxopts::value<std::string>())
		("d,down_replicas", "Replicas to mark unavailable before the race", cxxopts::value<int>()->default_value("0"))
		("release", "Release committed claims after the audit")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	Configuration& config = Configuration::getInstance();
	std::string config_file = arguments["config"].as<std::string>();
	bool config_ok = config_file.empty() ? config.validate() : config.loadFromFile(config_file);
	if (!config_ok) {
		LOG(ERROR) << "Failed to load configuration " << config_file;
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return EXIT_FAILURE;
	}
	FLAGS_v = std::max(arguments["log_level"].as<int>(), config.config().logging.verbosity.get());

	int num_claimants = arguments["claimants"].as<int>();
	int num_rows = arguments["rows"].as<int>();
	int rows_per_claim = arguments["rows_per_claim"].as<int>();
	int down_replicas = arguments["down_replicas"].as<int>();
	if (num_claimants < 1 || num_rows < 1 || rows_per_claim < 1 || rows_per_claim > num_rows) {
		LOG(ERROR) << "Need claimants >= 1 and 1 <= rows_per_claim <= rows";
		return EXIT_FAILURE;
	}
	if (down_replicas < 0 || down_replicas > config.getReplicationFactor()) {
		LOG(ERROR) << "down_replicas must be between 0 and the replication factor";
		return EXIT_FAILURE;
	}

	UniquenessOptions defaults;
	try {
		defaults = UniquenessOptions::FromConfig(config);
		if (arguments.count("ttl")) {
			defaults.ttl_seconds = arguments["ttl"].as<int>();
		}
		if (arguments.count("consistency")) {
			defaults.consistency_level = parseConsistencyLevel(arguments["consistency"].as<std::string>());
		}
	} catch (const std::invalid_argument& e) {
		LOG(ERROR) << e.what();
		return EXIT_FAILURE;
	}

	ReplicatedKeyspace keyspace(config.getReplicationFactor(), std::make_shared<SystemClock>(),
			config.getShardsPerReplica());
	for (int i = 0; i < down_replicas; ++i) {
		keyspace.SetReplicaAvailable(i, false);
	}

	ColumnFamily column_family{"identities"};
	std::vector<ClaimResult> results(num_claimants);
	std::vector<std::thread> threads;
	std::atomic<int> synchronizer{num_claimants};

	LOG(INFO) << "Racing " << num_claimants << " claimants over " << num_rows << " rows, "
		<< rows_per_claim << " rows each, consistency " << ConsistencyLevelName(defaults.consistency_level);

	for (int c = 0; c < num_claimants; ++c) {
		// Neighbouring claimants overlap on all but one row
		for (int j = 0; j < rows_per_claim; ++j) {
			results[c].rows.push_back(RowKey((c + j) % num_rows));
		}
		threads.emplace_back([&, c]() {
			ClaimResult& result = results[c];
			UniquenessOptions claim = defaults;
			for (const auto& row : result.rows) {
				claim.rows.push_back({column_family, row});
			}

			synchronizer--;
			while (synchronizer.load() > 0) {
				std::this_thread::yield();
			}

			try {
				UniquenessCoordinator coordinator(&keyspace, claim);
				result.token = coordinator.GetProbeToken();
				try {
					coordinator.Acquire();
					result.outcome = Outcome::COMMITTED;
				} catch (const NotUniqueException& e) {
					result.outcome = Outcome::NOT_UNIQUE;
					result.detail = e.row();
				} catch (const StorageException& e) {
					result.outcome = Outcome::STORAGE_FAILURE;
					result.detail = e.what();
				}
			} catch (const std::invalid_argument& e) {
				result.outcome = Outcome::STORAGE_FAILURE;
				result.detail = e.what();
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}

	int committed = 0;
	std::cout << std::left << std::setw(10) << "claimant" << std::setw(18) << "outcome"
		<< std::setw(40) << "token" << "detail" << std::endl;
	for (int c = 0; c < num_claimants; ++c) {
		const ClaimResult& result = results[c];
		if (result.outcome == Outcome::COMMITTED) {
			committed++;
		}
		std::cout << std::left << std::setw(10) << c << std::setw(18) << OutcomeName(result.outcome)
			<< std::setw(40) << result.token << result.detail << std::endl;
	}

	bool audit_ok = false;
	try {
		audit_ok = AuditClaims(keyspace, column_family, defaults, num_rows, results);
	} catch (const StorageException& e) {
		LOG(ERROR) << "Audit read failed: " << e.what();
	}
	LOG(INFO) << committed << " of " << num_claimants << " claimants committed, audit "
		<< (audit_ok ? "passed" : "FAILED");

	if (arguments.count("release")) {
		for (const auto& result : results) {
			if (result.outcome != Outcome::COMMITTED) {
				continue;
			}
			UniquenessOptions release = defaults;
			release.probe_token = result.token;
			for (const auto& row : result.rows) {
				release.rows.push_back({column_family, row});
			}
			try {
				UniquenessCoordinator(&keyspace, release).Release();
			} catch (const StorageException& e) {
				LOG(ERROR) << "Release of " << result.token << " failed: " << e.what();
				audit_ok = false;
			}
		}
		LOG(INFO) << "Released committed claims";
	}

	uint64_t gc_grace_us = static_cast<uint64_t>(config.config().storage.gc_grace_seconds.get()) * 1000000ULL;
	size_t removed = keyspace.Compact(gc_grace_us);
	VLOG(1) << "Compaction removed " << removed << " columns";

	return audit_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
