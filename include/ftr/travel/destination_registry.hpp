#pragma once

/// @file destination_registry.hpp
/// @brief In-memory destination registry seeded from YAML with a persisted
///        visited/coordinate state file.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "ftr/travel/destination.hpp"

namespace ftr::travel {

/// Seed format:
/// @code
///   destinations:
///     - name: Cierzo
///       scene: CierzoNewTerrain
///       coordinates: [1410.3, 6.7, 1665.6]
///       price: 200
///       enabled: true
/// @endcode
///
/// State format (written by saveState()):
/// @code
///   Cierzo:
///     visited: true
///   Berg:
///     visited: true
///     coordinates: [1204.0, -12.5, 1467.2]
/// @endcode
///
/// Only coordinates captured at runtime are written to the state file;
/// seeded coordinates stay owned by the seed.
class DestinationRegistry : public IDestinationRegistry {
public:
    DestinationRegistry() = default;

    /// Register a destination. AlreadyExists if the name is taken.
    foundation::TravelResult<void> add(Destination destination);

    /// Merge seed records: new names are added, existing ones are overwritten
    /// field by field for the keys present in the seed.
    foundation::TravelResult<void> loadSeed(const std::filesystem::path& path);
    foundation::TravelResult<void> loadSeedString(std::string_view yaml);

    /// Persist markVisited() updates to @p path.
    void setStatePath(std::filesystem::path path);

    /// Apply the state file over the current records. A missing file is not
    /// an error; unknown names are skipped.
    foundation::TravelResult<void> loadState();
    foundation::TravelResult<void> saveState() const;

    [[nodiscard]] std::size_t size() const noexcept { return destinations_.size(); }

    // ── IDestinationRegistry ────────────────────────────────────────────

    [[nodiscard]] std::optional<Destination> get(std::string_view name) const override;
    foundation::TravelResult<void> markVisited(std::string_view name,
                                               std::optional<Vector3> coordinates) override;
    [[nodiscard]] std::vector<Destination> listTravelable() const override;
    [[nodiscard]] std::vector<Destination> all() const override;

private:
    [[nodiscard]] Destination* find(std::string_view name);
    [[nodiscard]] const Destination* find(std::string_view name) const;

    std::vector<Destination> destinations_;
    std::unordered_set<std::string> capturedCoordinates_;
    std::optional<std::filesystem::path> statePath_;
};

}  // namespace ftr::travel
