#pragma once

#include "marquee/text/font.hpp"
#include "marquee/style/presets.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace marquee::text {

// ============================================================================
// Font Cache - resolved faces keyed by (preset, pixel size)
//
// Lookups take a shared lock, inserts an exclusive one. The first face
// inserted for a key wins and entries are never evicted.
// ============================================================================

struct FontKey {
    style::FontPreset preset{style::FontPreset::Impact};
    i32 pixel_size{0};

    [[nodiscard]] bool operator==(const FontKey& other) const {
        return preset == other.preset && pixel_size == other.pixel_size;
    }
};

struct FontKeyHash {
    std::size_t operator()(const FontKey& key) const;
};

class FontCache {
public:
    FontCache() = default;

    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    [[nodiscard]] std::shared_ptr<const FontFace> find(const FontKey& key) const;

    // Returns the cached face, which is `face` unless another insert won
    std::shared_ptr<const FontFace> insert(const FontKey& key, std::shared_ptr<const FontFace> face);

    [[nodiscard]] usize size() const;
    void clear();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<FontKey, std::shared_ptr<const FontFace>, FontKeyHash> m_entries;
};

// ============================================================================
// Font Resolver
// ============================================================================

struct FontResolverOptions {
    // Searched first for <name>.ttf / <name>.otf
    std::filesystem::path fonts_dir{"fonts"};

    // Searched recursively for a file whose stem matches the name
    std::vector<std::filesystem::path> system_dirs;

    // Ask fontconfig for a family match after the file searches
    bool use_fontconfig{true};

    // Tried after every preset candidate
    std::string last_resort_family{"DejaVuSans-Bold"};
};

class FontResolver {
public:
    explicit FontResolver(FontCache& cache, FontResolverOptions options = default_options());
    ~FontResolver();

    FontResolver(const FontResolver&) = delete;
    FontResolver& operator=(const FontResolver&) = delete;

    // Never fails: falls back to the built-in bitmap face
    [[nodiscard]] std::shared_ptr<const FontFace> resolve(style::FontPreset preset, i32 pixel_size);

    // Load a single family name through the search chain, bypassing the cache
    [[nodiscard]] std::shared_ptr<const FontFace> load_family(std::string_view name, i32 pixel_size,
                                                              style::FontWeight weight);

    [[nodiscard]] const FontResolverOptions& options() const { return m_options; }
    [[nodiscard]] FontCache& cache() { return m_cache; }

    [[nodiscard]] static FontResolverOptions default_options();
    [[nodiscard]] static std::vector<std::filesystem::path> system_font_dirs();

private:
    [[nodiscard]] std::optional<std::filesystem::path> find_in_fonts_dir(std::string_view name) const;
    [[nodiscard]] std::optional<std::filesystem::path> find_system_file(std::string_view name);
    [[nodiscard]] std::optional<std::filesystem::path> find_with_fontconfig(std::string_view name,
                                                                            style::FontWeight weight);

    [[nodiscard]] std::shared_ptr<const FontFace> try_load(const std::filesystem::path& path,
                                                           i32 pixel_size);

    FontCache& m_cache;
    FontResolverOptions m_options;
    std::shared_ptr<FreeTypeLibrary> m_library;

    // Lowercase file stem -> path, built on first use
    std::mutex m_index_mutex;
    std::optional<std::unordered_map<std::string, std::filesystem::path>> m_system_index;

    struct FontconfigState;
    std::unique_ptr<FontconfigState> m_fontconfig;
};

} // namespace marquee::text
