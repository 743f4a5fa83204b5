#pragma once

#include <optional>
#include <string>

namespace futmon {
namespace domain {

// The four independently cached data categories.
enum class Dataset { Account, Positions, Trades, Income };

const char* datasetToString(Dataset dataset);

// Maps a cache key ("account", "trades:BTCUSDT", "income:1:2") back to its
// dataset. nullopt for keys the monitor does not own.
std::optional<Dataset> datasetForKey(const std::string& key);

}  // namespace domain
}  // namespace futmon
