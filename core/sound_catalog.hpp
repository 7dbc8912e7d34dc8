#pragma once

#include <map>
#include <random>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "status_codes.hpp"

namespace peckwatch {

enum class ReactionMode { Predators, Woodpeckers, Mixed, Silent };

const char* reaction_mode_name(ReactionMode m);
// Accepts "predators", "woodpeckers" (or "woodpecker"), "mixed", "silent"
bool parse_reaction_mode(const std::string& s, ReactionMode& out);

// SoundCatalog indexes reaction sounds as <root>/<category>/<asset>. It is
// populated by scan() at startup and read-only afterwards, so concurrent
// readers need no locking. Categories without assets are listed but never
// selected by resolve().
class SoundCatalog {
public:
    using Listing = std::map<std::string, std::vector<std::string>>;

    SoundCatalog() = default;
    explicit SoundCatalog(const CatalogConfig& config);

    // Returns false when the root is missing or unreadable; `error` says why.
    bool scan(std::string& error);

    // Test and tooling hook: install a listing without touching disk.
    void assign(Listing listing);

    std::vector<std::string> categories() const;
    const Listing& listing() const { return listing_; }
    size_t total_assets() const;
    bool has_category(const std::string& category) const { return listing_.count(category) != 0; }

    // Uniform choice within a category. EmptyCategory when it holds no
    // assets, NotFound when it does not exist.
    Status pick(const std::string& category, std::mt19937& rng, std::string& asset) const;

    // Category for a reaction mode; false for SILENT or when no eligible
    // (existing, non-empty) category is left.
    bool resolve(ReactionMode mode, std::mt19937& rng, std::string& category) const;

    // Categories resolve() may return for `mode`, sorted.
    std::vector<std::string> eligible(ReactionMode mode) const;

    // Raw asset bytes; NotFound unless the pair is in the index.
    Status read_asset(const std::string& category, const std::string& filename, std::string& bytes) const;
    std::string asset_path(const std::string& category, const std::string& filename) const;
    std::string asset_url(const std::string& category, const std::string& filename) const;

    static std::string media_type(const std::string& filename);

    const CatalogConfig& get_config() const { return config_; }
    bool loaded() const { return loaded_; }

private:
    CatalogConfig config_;
    Listing listing_;
    bool loaded_ = false;

    bool has_allowed_extension(const std::string& filename) const;
};

} // namespace peckwatch
