/**
 * Font resolution: preset candidates -> fonts dir -> system files ->
 * fontconfig -> last-resort family -> built-in bitmap face
 */

#include "marquee/text/font_resolver.hpp"
#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"
#include <algorithm>
#include <cstdlib>
#include <fontconfig/fontconfig.h>

namespace marquee::text {

namespace fs = std::filesystem;

// ============================================================================
// FontCache
// ============================================================================

std::size_t FontKeyHash::operator()(const FontKey& key) const {
    std::size_t h = std::hash<u32>{}(static_cast<u32>(key.preset));
    h ^= std::hash<i32>{}(key.pixel_size) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

std::shared_ptr<const FontFace> FontCache::find(const FontKey& key) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        return it->second;
    }
    return nullptr;
}

std::shared_ptr<const FontFace> FontCache::insert(const FontKey& key,
                                                  std::shared_ptr<const FontFace> face) {
    std::unique_lock lock(m_mutex);
    return m_entries.try_emplace(key, std::move(face)).first->second;
}

usize FontCache::size() const {
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

void FontCache::clear() {
    std::unique_lock lock(m_mutex);
    m_entries.clear();
}

// ============================================================================
// Fontconfig
// ============================================================================

struct FontResolver::FontconfigState {
    FcConfig* config{nullptr};
    std::mutex mutex;

    ~FontconfigState() {
        if (config) {
            FcConfigDestroy(config);
        }
    }
};

namespace {

bool is_font_file(const fs::path& path) {
    const std::string extension = to_ascii_lower(path.extension().string());
    return extension == ".ttf" || extension == ".otf";
}

} // anonymous namespace

// ============================================================================
// FontResolver
// ============================================================================

FontResolver::FontResolver(FontCache& cache, FontResolverOptions options)
    : m_cache(cache)
    , m_options(std::move(options))
{
    auto& log = logging::get("text");

    auto library = FreeTypeLibrary::create();
    if (library) {
        m_library = std::move(library).value();
    } else {
        log.warn_fmt("FreeType unavailable ({}); only the built-in face can be used",
                     library.error());
    }

    if (m_options.use_fontconfig) {
        m_fontconfig = std::make_unique<FontconfigState>();
        m_fontconfig->config = FcInitLoadConfigAndFonts();
        if (!m_fontconfig->config) {
            log.debug("fontconfig initialization failed; family matching disabled");
            m_fontconfig.reset();
        }
    }
}

FontResolver::~FontResolver() = default;

FontResolverOptions FontResolver::default_options() {
    FontResolverOptions options;
    options.system_dirs = system_font_dirs();
    return options;
}

std::vector<fs::path> FontResolver::system_font_dirs() {
    std::vector<fs::path> dirs;
    const char* home = std::getenv("HOME");
#if defined(__APPLE__)
    dirs.emplace_back("/Library/Fonts");
    dirs.emplace_back("/System/Library/Fonts");
    if (home) {
        dirs.emplace_back(fs::path(home) / "Library/Fonts");
    }
#else
    dirs.emplace_back("/usr/share/fonts");
    dirs.emplace_back("/usr/local/share/fonts");
    if (home) {
        dirs.emplace_back(fs::path(home) / ".fonts");
        dirs.emplace_back(fs::path(home) / ".local/share/fonts");
    }
#endif
    return dirs;
}

std::shared_ptr<const FontFace> FontResolver::resolve(style::FontPreset preset, i32 pixel_size) {
    const i32 size = std::max(pixel_size, 1);
    const FontKey key{preset, size};

    if (auto cached = m_cache.find(key)) {
        return cached;
    }

    auto& log = logging::get("text");
    const style::FontStyle font_style = style::lookup_font_style(preset);

    for (std::string_view name : font_style.candidates()) {
        if (auto face = load_family(name, size, font_style.weight)) {
            log.info_fmt("Font {} @ {}px -> '{}' ({})", style::font_preset_name(preset), size,
                         name, face->family());
            return m_cache.insert(key, std::move(face));
        }
        log.debug_fmt("Font {}: '{}' unavailable, trying next fallback",
                      style::font_preset_name(preset), name);
    }

    if (!m_options.last_resort_family.empty()) {
        if (auto face = load_family(m_options.last_resort_family, size, font_style.weight)) {
            log.info_fmt("Font {} @ {}px -> last resort '{}'", style::font_preset_name(preset),
                         size, m_options.last_resort_family);
            return m_cache.insert(key, std::move(face));
        }
    }

    log.warn_fmt("Font {} @ {}px: no font file could be loaded, using the built-in bitmap face",
                 style::font_preset_name(preset), size);
    return m_cache.insert(key, std::make_shared<BuiltinFace>(size));
}

std::shared_ptr<const FontFace> FontResolver::load_family(std::string_view name, i32 pixel_size,
                                                          style::FontWeight weight) {
    auto& log = logging::get("text");

    if (auto path = find_in_fonts_dir(name)) {
        if (auto face = try_load(*path, pixel_size)) {
            log.debug_fmt("'{}' loaded from fonts dir: {}", name, path->string());
            return face;
        }
    }

    if (auto path = find_system_file(name)) {
        if (auto face = try_load(*path, pixel_size)) {
            log.debug_fmt("'{}' loaded from system fonts: {}", name, path->string());
            return face;
        }
    }

    if (auto path = find_with_fontconfig(name, weight)) {
        if (auto face = try_load(*path, pixel_size)) {
            log.debug_fmt("'{}' loaded through fontconfig: {}", name, path->string());
            return face;
        }
    }

    return nullptr;
}

std::optional<fs::path> FontResolver::find_in_fonts_dir(std::string_view name) const {
    if (m_options.fonts_dir.empty() || name.empty()) {
        return std::nullopt;
    }

    for (const char* extension : {".ttf", ".otf"}) {
        fs::path candidate = m_options.fonts_dir / (std::string(name) + extension);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> FontResolver::find_system_file(std::string_view name) {
    std::lock_guard<std::mutex> lock(m_index_mutex);

    if (!m_system_index) {
        std::vector<fs::path> files;
        for (const auto& dir : m_options.system_dirs) {
            std::error_code ec;
            if (!fs::is_directory(dir, ec)) {
                continue;
            }

            fs::recursive_directory_iterator it(
                dir, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec) && is_font_file(it->path())) {
                    files.push_back(it->path());
                }
            }
        }

        // Sorted so that duplicate stems resolve the same way on every run
        std::sort(files.begin(), files.end());

        m_system_index.emplace();
        for (const auto& file : files) {
            m_system_index->try_emplace(to_ascii_lower(file.stem().string()), file);
        }
        logging::get("text").debug_fmt("Indexed {} system font files", m_system_index->size());
    }

    auto it = m_system_index->find(to_ascii_lower(name));
    if (it != m_system_index->end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<fs::path> FontResolver::find_with_fontconfig(std::string_view name,
                                                           style::FontWeight weight) {
    if (!m_fontconfig || name.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_fontconfig->mutex);
    FcConfig* config = m_fontconfig->config;

    FcPattern* pattern = FcPatternCreate();
    if (!pattern) {
        return std::nullopt;
    }

    const std::string family(name);
    const int fc_weight = weight == style::FontWeight::Bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR;
    if (!FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8*>(family.c_str())) ||
        !FcPatternAddInteger(pattern, FC_WEIGHT, fc_weight) ||
        !FcConfigSubstitute(config, pattern, FcMatchPattern)) {
        FcPatternDestroy(pattern);
        return std::nullopt;
    }
    FcDefaultSubstitute(pattern);

    FcResult result = FcResultNoMatch;
    FcPattern* match = FcFontMatch(config, pattern, &result);
    FcPatternDestroy(pattern);
    if (!match) {
        return std::nullopt;
    }

    // fontconfig always returns its best guess; only an exact family counts
    std::optional<fs::path> found;
    FcChar8* matched_family = nullptr;
    FcChar8* file = nullptr;
    if (FcPatternGetString(match, FC_FAMILY, 0, &matched_family) == FcResultMatch &&
        FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch &&
        equals_ignore_case(reinterpret_cast<const char*>(matched_family), name)) {
        found = fs::path(reinterpret_cast<const char*>(file));
    }
    FcPatternDestroy(match);
    return found;
}

std::shared_ptr<const FontFace> FontResolver::try_load(const fs::path& path, i32 pixel_size) {
    if (!m_library) {
        return nullptr;
    }

    auto face = m_library->load_face(path.string(), pixel_size);
    if (!face) {
        logging::get("text").debug_fmt("Skipping {}: {}", path.string(), face.error());
        return nullptr;
    }
    return std::move(face).value();
}

} // namespace marquee::text
