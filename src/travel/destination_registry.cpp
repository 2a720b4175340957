#include "ftr/travel/destination_registry.hpp"

#include <fstream>
#include <iterator>

#include <yaml-cpp/yaml.h>

#include "ftr/foundation/travel_logger.hpp"
#include "ftr/travel/text_match.hpp"

namespace ftr::travel {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::TravelError;
using foundation::TravelResult;

namespace {

std::optional<Vector3> readCoordinates(const YAML::Node& node) {
    if (!node || !node.IsSequence() || node.size() != 3) {
        return std::nullopt;
    }
    return Vector3{node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
}

void emitCoordinates(YAML::Emitter& out, const Vector3& v) {
    out << YAML::Flow << YAML::BeginSeq << v.x << v.y << v.z << YAML::EndSeq;
}

/// Apply the keys present in @p node onto @p dest.
void mergeSeedRecord(const YAML::Node& node, Destination& dest) {
    if (node["coordinates"]) {
        dest.coordinates = readCoordinates(node["coordinates"]);
    }
    if (node["price"]) {
        dest.price = node["price"].as<int64_t>();
    }
    if (node["enabled"]) {
        dest.enabled = node["enabled"].as<bool>();
    }
    if (node["visited"]) {
        dest.visited = node["visited"].as<bool>();
    }
    if (node["scene"]) {
        dest.sceneId = node["scene"].as<std::string>();
    }
    if (node["description"]) {
        dest.description = node["description"].as<std::string>();
    }
    if (node["target_node"]) {
        dest.targetNodeName = node["target_node"].as<std::string>();
    }
}

} // namespace

Destination* DestinationRegistry::find(std::string_view name) {
    for (auto& dest : destinations_) {
        if (equalsIgnoreCase(dest.name, name)) {
            return &dest;
        }
    }
    return nullptr;
}

const Destination* DestinationRegistry::find(std::string_view name) const {
    for (const auto& dest : destinations_) {
        if (equalsIgnoreCase(dest.name, name)) {
            return &dest;
        }
    }
    return nullptr;
}

TravelResult<void> DestinationRegistry::add(Destination destination) {
    if (destination.name.empty()) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::InvalidArgument, "destination name must not be empty"));
    }
    if (find(destination.name) != nullptr) {
        return TravelResult<void>::err(
            TravelError(ErrorCode::AlreadyExists, "destination exists: " + destination.name));
    }
    destinations_.push_back(std::move(destination));
    return TravelResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Seeding
// ---------------------------------------------------------------------------

TravelResult<void> DestinationRegistry::loadSeed(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::RegistryLoadFailed, "failed to open destination seed: " + path.string()));
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return loadSeedString(text);
}

TravelResult<void> DestinationRegistry::loadSeedString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        auto list = root["destinations"];
        if (!list || !list.IsSequence()) {
            return TravelResult<void>::err(TravelError(
                ErrorCode::RegistryLoadFailed, "seed has no 'destinations' sequence"));
        }
        for (const auto& node : list) {
            if (!node["name"]) {
                FTR_LOG_WARN(LogCategory::Registry, "skipping seed record without a name");
                continue;
            }
            auto name = node["name"].as<std::string>();
            if (auto* existing = find(name)) {
                mergeSeedRecord(node, *existing);
                continue;
            }
            Destination dest;
            dest.name = name;
            mergeSeedRecord(node, dest);
            destinations_.push_back(std::move(dest));
        }
    } catch (const YAML::Exception& e) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::RegistryLoadFailed, std::string("destination seed error: ") + e.what()));
    }
    FTR_LOG_INFO(LogCategory::Registry,
                 "destinations registered: " + std::to_string(destinations_.size()));
    return TravelResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Persisted state
// ---------------------------------------------------------------------------

void DestinationRegistry::setStatePath(std::filesystem::path path) {
    statePath_ = std::move(path);
}

TravelResult<void> DestinationRegistry::loadState() {
    if (!statePath_ || !std::filesystem::exists(*statePath_)) {
        return TravelResult<void>::ok();
    }
    try {
        auto root = YAML::LoadFile(statePath_->string());
        if (!root.IsMap()) {
            return TravelResult<void>::ok();
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            auto name = it->first.as<std::string>();
            auto* dest = find(name);
            if (dest == nullptr) {
                FTR_LOG_DEBUG(LogCategory::Registry, "state for unknown destination: " + name);
                continue;
            }
            const auto& node = it->second;
            if (node["visited"]) {
                dest->visited = node["visited"].as<bool>();
            }
            if (auto coords = readCoordinates(node["coordinates"]); coords && !dest->coordinates) {
                dest->coordinates = coords;
                capturedCoordinates_.insert(dest->name);
            }
        }
    } catch (const YAML::Exception& e) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::RegistryLoadFailed, std::string("destination state error: ") + e.what()));
    }
    return TravelResult<void>::ok();
}

TravelResult<void> DestinationRegistry::saveState() const {
    if (!statePath_) {
        return TravelResult<void>::ok();
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& dest : destinations_) {
        const bool captured = capturedCoordinates_.count(dest.name) > 0 && dest.coordinates;
        if (!dest.visited && !captured) {
            continue;
        }
        out << YAML::Key << dest.name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "visited" << YAML::Value << dest.visited;
        if (captured) {
            out << YAML::Key << "coordinates" << YAML::Value;
            emitCoordinates(out, *dest.coordinates);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    std::ofstream file(*statePath_, std::ios::trunc);
    if (!file) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::RegistrySaveFailed, "failed to write state: " + statePath_->string()));
    }
    file << out.c_str() << '\n';
    if (!file) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::RegistrySaveFailed, "failed to write state: " + statePath_->string()));
    }
    return TravelResult<void>::ok();
}

// ---------------------------------------------------------------------------
// IDestinationRegistry
// ---------------------------------------------------------------------------

std::optional<Destination> DestinationRegistry::get(std::string_view name) const {
    if (const auto* dest = find(name)) {
        return *dest;
    }
    return std::nullopt;
}

TravelResult<void> DestinationRegistry::markVisited(std::string_view name,
                                                    std::optional<Vector3> coordinates) {
    auto* dest = find(name);
    if (dest == nullptr) {
        return TravelResult<void>::err(TravelError(
            ErrorCode::DestinationNotFound, "unknown destination: " + std::string(name)));
    }
    dest->visited = true;
    if (coordinates && !dest->coordinates) {
        dest->coordinates = coordinates;
        capturedCoordinates_.insert(dest->name);
        FTR_LOG_INFO(LogCategory::Registry, "coordinates captured for " + dest->name);
    }
    return saveState();
}

std::vector<Destination> DestinationRegistry::listTravelable() const {
    std::vector<Destination> result;
    for (const auto& dest : destinations_) {
        if (dest.isTravelable()) {
            result.push_back(dest);
        }
    }
    return result;
}

std::vector<Destination> DestinationRegistry::all() const {
    return destinations_;
}

}  // namespace ftr::travel
