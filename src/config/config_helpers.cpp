#include <spdlog/spdlog.h>
#include <tally/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <functional>
#include <limits>

namespace tally::config {

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::string text(s);
    trim(text);
    if (text.empty())
        return std::nullopt;

    std::int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string text(s);
    trim(text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "on" || text == "1")
        return true;
    if (text == "false" || text == "no" || text == "off" || text == "0")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "storage.path" at top level and "[storage] path"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "tally";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "tally";
    }
    return std::filesystem::current_path() / ".tally";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "tally";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "tally";
    }
    return std::filesystem::current_path() / "tally_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("TALLY_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

namespace {

Result<void> applyInt(const std::filesystem::path& path, const std::string& section,
                      const std::string& key, std::int64_t minimum,
                      const std::function<void(std::int64_t)>& assign) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return {};

    // Every integer setting ends up in an int (retry counts, SQLite busy timeout).
    auto value = parse_int(raw);
    if (!value || *value < minimum || *value > std::numeric_limits<int>::max()) {
        return Error{ErrorCode::InvalidArgument, "Invalid value for [" + section + "] " + key +
                                                     ": '" + raw + "' in " + path.string()};
    }
    assign(*value);
    return {};
}

} // namespace

Result<LedgerSettings> load_settings(const std::string& config_override,
                                     const std::string& db_override) {
    LedgerSettings settings;
    settings.configPath = get_config_path(config_override);

    const auto& path = settings.configPath;
    const bool haveFile = std::filesystem::exists(path);
    if (!haveFile && !config_override.empty()) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }

    std::string dbPath;
    if (haveFile) {
        spdlog::debug("Loading configuration from {}", path.string());
        dbPath = parse_config_value(path, "storage", "path");

        auto r = applyInt(path, "storage", "busy_timeout_ms", 0, [&](std::int64_t v) {
            settings.storage.busyTimeout = std::chrono::milliseconds(v);
        });
        if (!r)
            return r.error();

        r = applyInt(path, "storage", "max_retries", 1, [&](std::int64_t v) {
            settings.storage.retry.maxAttempts = static_cast<int>(v);
        });
        if (!r)
            return r.error();

        r = applyInt(path, "storage", "retry_delay_ms", 0, [&](std::int64_t v) {
            settings.storage.retry.initialDelay = std::chrono::milliseconds(v);
        });
        if (!r)
            return r.error();

        auto walRaw = parse_config_value(path, "storage", "enable_wal");
        if (!walRaw.empty()) {
            auto wal = parse_bool(walRaw);
            if (!wal) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid value for [storage] enable_wal: '" + walRaw + "'"};
            }
            settings.storage.enableWAL = *wal;
        }

        auto archiveRaw = parse_config_value(path, "ledger", "include_overrides_in_archive");
        if (!archiveRaw.empty()) {
            auto include = parse_bool(archiveRaw);
            if (!include) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid value for [ledger] include_overrides_in_archive: '" +
                                 archiveRaw + "'"};
            }
            settings.includeOverridesInArchive = *include;
        }
    }

    if (const char* env = std::getenv("TALLY_DB"); env && *env) {
        dbPath = env;
    }
    if (!db_override.empty()) {
        dbPath = db_override;
    }

    if (dbPath.empty()) {
        settings.storage.path = (get_data_dir() / "tally.db").string();
    } else if (dbPath == ":memory:") {
        settings.storage.path = dbPath;
    } else {
        settings.storage.path = expand_tilde(dbPath).string();
    }

    return settings;
}

} // namespace tally::config
