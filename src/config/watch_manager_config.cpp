#include "treewatch/config/watch_manager_config.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string_view>
#include <thread>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace treewatch {

namespace {

constexpr char kStringPattern[] = "\"((?:[^\"\\\\]|\\\\.)*)\"";

std::string JsonEscape(std::string_view s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '\\':
        case '"':
            out.push_back('\\');
            out.push_back(c);
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::string JsonUnescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        switch (s[++i]) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default:
            out += s[i];
            break;
        }
    }
    return out;
}

// First capture group of `"key": <value_pattern>`, if the key is present.
std::optional<std::string> MatchField(const std::string& text, std::string_view key,
                                      std::string_view value_pattern) {
    const std::regex field_re(absl::StrCat("\"", absl::string_view(key.data(), key.size()), "\"\\s*:\\s*",
                                           absl::string_view(value_pattern.data(), value_pattern.size())));
    std::smatch match;
    if (!std::regex_search(text, match, field_re)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::optional<std::string> StringField(const std::string& text, std::string_view key) {
    auto raw = MatchField(text, key, kStringPattern);
    if (!raw) {
        return std::nullopt;
    }
    return JsonUnescape(*raw);
}

std::optional<uint64_t> UnsignedField(const std::string& text, std::string_view key) {
    auto raw = MatchField(text, key, "([0-9]+)");
    uint64_t value = 0;
    if (!raw || !absl::SimpleAtoi(*raw, &value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> BoolField(const std::string& text, std::string_view key) {
    auto raw = MatchField(text, key, "(true|false)");
    if (!raw) {
        return std::nullopt;
    }
    return *raw == "true";
}

std::optional<std::vector<std::filesystem::path>> ParseWatchRoots(const std::string& text) {
    auto body = MatchField(text, "watch_roots", "\\[([^\\]]*)\\]");
    if (!body) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> roots;
    const std::regex item_re(kStringPattern);
    for (std::sregex_iterator it(body->begin(), body->end(), item_re), end; it != end; ++it) {
        std::string root = JsonUnescape((*it)[1].str());
        if (!root.empty()) {
            roots.emplace_back(std::move(root));
        }
    }
    return roots;
}

size_t DefaultMaxThreads() {
    const unsigned int cores = std::thread::hardware_concurrency();
    return cores > 1 ? cores / 2 : 1;
}

}  // namespace

WatchManagerConfig::WatchManagerConfig()
    : max_threads_(DefaultMaxThreads()),
      poll_timeout_(500),
      event_queue_capacity_(4096),
      follow_symlinks_(true),
      include_hidden_(false),
      log_level_("info") {
}

WatchManagerConfig::~WatchManagerConfig() = default;

absl::Status WatchManagerConfig::Load(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return absl::NotFoundError("Config file not found");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    const std::string text = contents.str();

    // Validate every numeric field before touching the current settings.
    const auto max_threads = UnsignedField(text, "max_threads");
    const auto poll_timeout_ms = UnsignedField(text, "poll_timeout_ms");
    const auto queue_capacity = UnsignedField(text, "event_queue_capacity");
    if (max_threads && *max_threads == 0) {
        return absl::InvalidArgumentError("max_threads must be at least 1");
    }
    if (poll_timeout_ms && *poll_timeout_ms == 0) {
        return absl::InvalidArgumentError("poll_timeout_ms must be positive");
    }
    if (queue_capacity && *queue_capacity == 0) {
        return absl::InvalidArgumentError("event_queue_capacity must be positive");
    }

    if (max_threads) {
        max_threads_ = static_cast<size_t>(*max_threads);
    }
    if (poll_timeout_ms) {
        poll_timeout_ = std::chrono::milliseconds(*poll_timeout_ms);
    }
    if (queue_capacity) {
        event_queue_capacity_ = static_cast<size_t>(*queue_capacity);
    }
    follow_symlinks_ = BoolField(text, "follow_symlinks").value_or(follow_symlinks_);
    include_hidden_ = BoolField(text, "include_hidden").value_or(include_hidden_);
    log_level_ = StringField(text, "log_level").value_or(log_level_);
    if (auto roots = ParseWatchRoots(text)) {
        watch_roots_ = std::move(*roots);
    }
    return absl::OkStatus();
}

absl::Status WatchManagerConfig::Save(const std::filesystem::path& config_file) const {
    const auto parent = config_file.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return absl::InternalError(
                absl::StrCat("Failed to create config directory ", parent.string(), ": ", ec.message()));
        }
    }

    std::string json = "{\n";
    absl::StrAppend(&json, "  \"max_threads\": ", max_threads_, ",\n");
    absl::StrAppend(&json, "  \"poll_timeout_ms\": ", poll_timeout_.count(), ",\n");
    absl::StrAppend(&json, "  \"event_queue_capacity\": ", event_queue_capacity_, ",\n");
    absl::StrAppend(&json, "  \"follow_symlinks\": ", follow_symlinks_ ? "true" : "false", ",\n");
    absl::StrAppend(&json, "  \"include_hidden\": ", include_hidden_ ? "true" : "false", ",\n");
    absl::StrAppend(&json, "  \"log_level\": \"", JsonEscape(log_level_), "\",\n");
    absl::StrAppend(&json, "  \"watch_roots\": [");
    for (size_t i = 0; i < watch_roots_.size(); ++i) {
        absl::StrAppend(&json, i == 0 ? "\n" : ",\n", "    \"", JsonEscape(watch_roots_[i].string()), "\"");
    }
    absl::StrAppend(&json, watch_roots_.empty() ? "]\n" : "\n  ]\n", "}\n");

    std::ofstream out(config_file, std::ios::trunc);
    if (!out.is_open()) {
        return absl::InternalError(absl::StrCat("Cannot open ", config_file.string(), " for writing"));
    }
    out << json;
    if (!out) {
        return absl::InternalError("Failed to write config file");
    }
    return absl::OkStatus();
}

void WatchManagerConfig::SetMaxThreads(size_t threads) {
    max_threads_ = threads > 0 ? threads : 1;
}

size_t WatchManagerConfig::GetMaxThreads() const {
    return max_threads_;
}

void WatchManagerConfig::SetPollTimeout(std::chrono::milliseconds timeout) {
    poll_timeout_ = timeout;
}

std::chrono::milliseconds WatchManagerConfig::GetPollTimeout() const {
    return poll_timeout_;
}

void WatchManagerConfig::SetEventQueueCapacity(size_t capacity) {
    event_queue_capacity_ = capacity;
}

size_t WatchManagerConfig::GetEventQueueCapacity() const {
    return event_queue_capacity_;
}

void WatchManagerConfig::SetFollowSymlinks(bool follow) {
    follow_symlinks_ = follow;
}

bool WatchManagerConfig::GetFollowSymlinks() const {
    return follow_symlinks_;
}

void WatchManagerConfig::SetIncludeHidden(bool include) {
    include_hidden_ = include;
}

bool WatchManagerConfig::GetIncludeHidden() const {
    return include_hidden_;
}

PathFilter WatchManagerConfig::BuildFilter() const {
    return include_hidden_ ? AcceptAllFilter() : DefaultPathFilter();
}

void WatchManagerConfig::AddWatchRoot(const std::filesystem::path& root) {
    if (std::find(watch_roots_.begin(), watch_roots_.end(), root) == watch_roots_.end()) {
        watch_roots_.push_back(root);
    }
}

void WatchManagerConfig::RemoveWatchRoot(const std::filesystem::path& root) {
    watch_roots_.erase(std::remove(watch_roots_.begin(), watch_roots_.end(), root), watch_roots_.end());
}

const std::vector<std::filesystem::path>& WatchManagerConfig::GetWatchRoots() const {
    return watch_roots_;
}

void WatchManagerConfig::SetLogLevel(const std::string& level) {
    log_level_ = level;
}

const std::string& WatchManagerConfig::GetLogLevel() const {
    return log_level_;
}

}  // namespace treewatch
