#include "sound_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace peckwatch {

static std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

const char* reaction_mode_name(ReactionMode m) {
    switch (m) {
        case ReactionMode::Predators: return "predators";
        case ReactionMode::Woodpeckers: return "woodpeckers";
        case ReactionMode::Mixed: return "mixed";
        case ReactionMode::Silent: return "silent";
    }
    return "predators";
}

bool parse_reaction_mode(const std::string& s, ReactionMode& out) {
    const std::string v = to_lower(s);
    if (v == "predators") { out = ReactionMode::Predators; return true; }
    if (v == "woodpeckers" || v == "woodpecker") { out = ReactionMode::Woodpeckers; return true; }
    if (v == "mixed") { out = ReactionMode::Mixed; return true; }
    if (v == "silent") { out = ReactionMode::Silent; return true; }
    return false;
}

SoundCatalog::SoundCatalog(const CatalogConfig& config) : config_(config) {}

bool SoundCatalog::has_allowed_extension(const std::string& filename) const {
    const std::string ext = to_lower(fs::path(filename).extension().string());
    for (const auto& allowed : config_.extensions) {
        if (ext == to_lower(allowed)) return true;
    }
    return false;
}

bool SoundCatalog::scan(std::string& error) {
    listing_.clear();
    loaded_ = false;
    std::error_code ec;
    const fs::path root(config_.sounds_dir);
    if (!fs::is_directory(root, ec)) {
        error = "sound directory not found: " + config_.sounds_dir;
        return false;
    }
    try {
        for (const auto& entry : fs::directory_iterator(root)) {
            if (!entry.is_directory()) continue;
            const std::string category = entry.path().filename().string();
            if (category.empty() || category[0] == '.') continue;
            std::vector<std::string> assets;
            for (const auto& file : fs::directory_iterator(entry.path())) {
                if (!file.is_regular_file()) continue;
                const std::string name = file.path().filename().string();
                if (!name.empty() && name[0] != '.' && has_allowed_extension(name)) assets.push_back(name);
            }
            std::sort(assets.begin(), assets.end());
            if (assets.empty()) {
                std::cerr << "Sound category '" << category << "' has no playable assets" << std::endl;
            }
            listing_.emplace(category, std::move(assets));
        }
    } catch (const fs::filesystem_error& e) {
        listing_.clear();
        error = std::string("cannot scan sound directory: ") + e.what();
        return false;
    }
    loaded_ = true;
    return true;
}

void SoundCatalog::assign(Listing listing) {
    listing_ = std::move(listing);
    for (auto& kv : listing_) std::sort(kv.second.begin(), kv.second.end());
    loaded_ = true;
}

std::vector<std::string> SoundCatalog::categories() const {
    std::vector<std::string> out;
    out.reserve(listing_.size());
    for (const auto& kv : listing_) out.push_back(kv.first);
    return out;
}

size_t SoundCatalog::total_assets() const {
    size_t n = 0;
    for (const auto& kv : listing_) n += kv.second.size();
    return n;
}

Status SoundCatalog::pick(const std::string& category, std::mt19937& rng, std::string& asset) const {
    auto it = listing_.find(category);
    if (it == listing_.end()) return Status::NotFound;
    const auto& assets = it->second;
    if (assets.empty()) return Status::EmptyCategory;
    std::uniform_int_distribution<size_t> dist(0, assets.size() - 1);
    asset = assets[dist(rng)];
    return Status::Ok;
}

std::vector<std::string> SoundCatalog::eligible(ReactionMode mode) const {
    std::vector<std::string> out;
    auto non_empty = [this](const std::string& c) {
        auto it = listing_.find(c);
        return it != listing_.end() && !it->second.empty();
    };
    switch (mode) {
        case ReactionMode::Silent:
            break;
        case ReactionMode::Predators:
            for (const auto& c : config_.predator_categories) if (non_empty(c)) out.push_back(c);
            break;
        case ReactionMode::Woodpeckers:
            for (const auto& c : config_.woodpecker_categories) if (non_empty(c)) out.push_back(c);
            break;
        case ReactionMode::Mixed:
            for (const auto& kv : listing_) if (!kv.second.empty()) out.push_back(kv.first);
            break;
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool SoundCatalog::resolve(ReactionMode mode, std::mt19937& rng, std::string& category) const {
    const auto pool = eligible(mode);
    if (pool.empty()) return false;
    std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
    category = pool[dist(rng)];
    return true;
}

std::string SoundCatalog::asset_path(const std::string& category, const std::string& filename) const {
    return (fs::path(config_.sounds_dir) / category / filename).string();
}

std::string SoundCatalog::asset_url(const std::string& category, const std::string& filename) const {
    std::string prefix = config_.url_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return prefix + "/" + category + "/" + filename;
}

Status SoundCatalog::read_asset(const std::string& category, const std::string& filename, std::string& bytes) const {
    auto it = listing_.find(category);
    if (it == listing_.end()) return Status::NotFound;
    if (!std::binary_search(it->second.begin(), it->second.end(), filename)) return Status::NotFound;

    std::ifstream f(asset_path(category, filename), std::ios::binary);
    if (!f) return Status::NotFound;
    bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return Status::Ok;
}

std::string SoundCatalog::media_type(const std::string& filename) {
    const std::string ext = to_lower(fs::path(filename).extension().string());
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".ogg") return "audio/ogg";
    if (ext == ".flac") return "audio/flac";
    return "application/octet-stream";
}

} // namespace peckwatch
