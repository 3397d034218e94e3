#include <mcp_fleet/registry/tool_discovery.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

#include <openssl/evp.h>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace mcp_fleet {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kContentSniffBytes = 1024;
constexpr std::size_t kDescriptionHeadBytes = 500;
constexpr std::size_t kMaxDescription = 200;
constexpr std::size_t kMinDescription = 10;
constexpr int kDescriptionLines = 10;

const std::set<std::string> kToolExtensions = {
    ".py", ".js", ".ts", ".sh", ".exe", ".jar", "",
};

const std::array<const char*, 4> kNameKeywords = {"mcp", "server", "tool", "agent"};

const std::array<const char*, 4> kContentMarkers = {
    "mcp", "model context protocol", "stdio", "tools/list",
};

std::string ReadHead(const fs::path& file, std::size_t max_bytes) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return "";
    std::string buffer(max_bytes, '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(max_bytes));
    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return buffer;
}

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

// Turn a file stem into a valid tool name.
std::string SanitizeName(const std::string& stem) {
    std::string name;
    for (char c : stem) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '-' || c == '.') {
            name.push_back(c);
        } else {
            name.push_back('_');
        }
    }
    while (!name.empty() && (name.front() == '.' || name.front() == '-')) {
        name.erase(name.begin());
    }
    if (name.size() > 64) name.resize(64);
    return name;
}

// True if path lies under root (component-wise).
bool IsUnder(const fs::path& path, const fs::path& root) {
    auto p = path.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++p) {
        if (r->empty()) continue;
        if (p == path.end() || *p != *r) return false;
    }
    return true;
}

fs::path Normalize(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) return path.lexically_normal();
    return absolute.lexically_normal();
}

fs::path ExpandHome(const std::string& path) {
    if (path.size() >= 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home != nullptr) {
            return fs::path(home) / path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1);
        }
    }
    return fs::path(path);
}

} // anonymous namespace

nlohmann::json DiscoveryResult::ToJson() const {
    auto errs = nlohmann::json::array();
    for (const auto& [path, message] : errors) {
        errs.push_back({{"path", path}, {"error", message}});
    }
    return {
        {"new", added},
        {"updated", updated},
        {"removed", removed},
        {"errors", errs},
    };
}

bool LooksLikeMcpTool(const fs::path& file) {
    const auto extension = ToLower(file.extension().string());
    if (kToolExtensions.count(extension) == 0) {
        return false;
    }

    const auto filename = ToLower(file.filename().string());
    for (const auto* keyword : kNameKeywords) {
        if (filename.find(keyword) != std::string::npos) {
            return true;
        }
    }

    if (::access(file.c_str(), X_OK) == 0) {
        return true;
    }

    const auto head = ToLower(ReadHead(file, kContentSniffBytes));
    for (const auto* marker : kContentMarkers) {
        if (head.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Result<std::string, Error> HashFile(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorKind::Config, "HashFile", "Cannot read " + file.string()));
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return Result<std::string, Error>::Err(Error::Make(
            ErrorKind::Internal, "HashFile", "SHA-256 initialisation failed"));
    }

    std::array<char, 8192> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = in.gcount();
        if (n > 0) {
            EVP_DigestUpdate(ctx, buffer.data(), static_cast<std::size_t>(n));
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const int ok = EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);
    if (ok != 1) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorKind::Internal, "HashFile", "SHA-256 finalisation failed"));
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return Result<std::string, Error>::Ok(hex.str());
}

std::string ExtractDescription(const std::string& head) {
    std::istringstream lines(head);
    std::string line;
    for (int i = 0; i < kDescriptionLines && std::getline(lines, line); ++i) {
        line = Trim(line);
        if (line.rfind("#!", 0) == 0) continue;

        std::string text;
        if (line.rfind("#", 0) == 0 || line.rfind("//", 0) == 0) {
            const auto start = line.find_first_not_of("#/");
            text = start == std::string::npos ? "" : Trim(line.substr(start));
        } else if (line.rfind("\"\"\"", 0) == 0 || line.rfind("'''", 0) == 0) {
            text = line.substr(3);
            const auto close = text.find(line.substr(0, 3));
            if (close != std::string::npos) text.resize(close);
            text = Trim(text);
        } else {
            continue;
        }

        if (text.size() > kMinDescription) {
            if (text.size() > kMaxDescription) text.resize(kMaxDescription);
            return text;
        }
    }
    return "";
}

Result<ToolDefinition, Error> DefinitionFromFile(const fs::path& file) {
    auto hash = HashFile(file);
    if (hash.IsErr()) {
        return Result<ToolDefinition, Error>::Err(hash.Error());
    }

    ToolDefinition def;
    def.name = SanitizeName(file.stem().string());
    def.source = ToolSource::Discovered;
    def.source_path = file.string();
    def.content_hash = std::move(hash).Value();
    def.auto_restart = false;
    def.description = ExtractDescription(ReadHead(file, kDescriptionHeadBytes));
    if (def.description.empty()) {
        def.description = "Discovered MCP tool: " + def.name;
    }

    const auto extension = ToLower(file.extension().string());
    if (extension == ".py") {
        def.command = "python3";
        def.args = {file.string()};
    } else if (extension == ".js" || extension == ".ts") {
        def.command = "node";
        def.args = {file.string()};
    } else if (extension == ".sh") {
        def.command = "bash";
        def.args = {file.string()};
    } else if (extension == ".jar") {
        def.command = "java";
        def.args = {"-jar", file.string()};
    } else {
        def.command = file.string();
    }
    def.working_directory = file.parent_path().string();

    auto valid = ValidateToolDefinition(def);
    if (valid.IsErr()) {
        return Result<ToolDefinition, Error>::Err(valid.Error());
    }
    return Result<ToolDefinition, Error>::Ok(std::move(def));
}

// ---------------------------------------------------------------------------
// ToolDiscovery
// ---------------------------------------------------------------------------
ToolDiscovery::ToolDiscovery(ToolRegistry& registry) : registry_(registry) {}

std::vector<std::string> ToolDiscovery::DefaultPaths() {
    return {"./data/tools", "./tools", "~/.mcp/tools", "/opt/mcp/tools"};
}

void ToolDiscovery::Scan(const fs::path& root, bool recursive,
                         std::vector<fs::path>& out, DiscoveryResult& result) const {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) {
        out.push_back(root);
        return;
    }

    auto visit = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) return;
        if (LooksLikeMcpTool(entry.path())) {
            out.push_back(Normalize(entry.path()));
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(
            root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    } else {
        fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    }
    if (ec) {
        result.errors.emplace_back(root.string(), ec.message());
    }
}

DiscoveryResult ToolDiscovery::Discover(const std::vector<std::string>& paths,
                                        bool recursive) {
    DiscoveryResult result;
    const auto requested = paths.empty() ? DefaultPaths() : paths;

    std::vector<fs::path> roots;
    std::vector<fs::path> candidates;
    for (const auto& raw : requested) {
        const auto root = Normalize(ExpandHome(raw));
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            LogDebug("discovery", "Skipping missing path " + root.string());
            continue;
        }
        roots.push_back(root);
        Scan(root, recursive, candidates, result);
    }

    // Candidate name -> path, first one wins.
    std::map<std::string, fs::path> seen;
    std::set<std::string> found_paths;

    for (const auto& path : candidates) {
        auto def_result = DefinitionFromFile(path);
        if (def_result.IsErr()) {
            result.errors.emplace_back(path.string(), def_result.Error().message);
            continue;
        }
        auto def = std::move(def_result).Value();
        found_paths.insert(def.source_path);

        if (!seen.emplace(def.name, path).second) {
            result.errors.emplace_back(
                path.string(), "Duplicate tool name '" + def.name + "' (already found at " +
                                   seen[def.name].string() + ")");
            continue;
        }

        auto existing = registry_.Get(def.name);
        if (!existing) {
            const auto name = def.name;
            auto registered = registry_.Register(std::move(def));
            if (registered.IsErr()) {
                result.errors.emplace_back(path.string(), registered.Error().message);
            } else {
                result.added.push_back(name);
            }
            continue;
        }

        if (existing->source != ToolSource::Discovered) {
            result.errors.emplace_back(
                path.string(), "Name '" + def.name + "' is taken by a " +
                                   ToolSourceName(existing->source) + " tool");
            continue;
        }

        if (existing->content_hash != def.content_hash ||
            existing->command != def.command || existing->args != def.args) {
            const auto name = def.name;
            auto replaced = registry_.Replace(std::move(def));
            if (replaced.IsErr()) {
                result.errors.emplace_back(path.string(), replaced.Error().message);
            } else {
                result.updated.push_back(name);
            }
        }
    }

    // Discovered tools under a scanned root whose file is gone.
    for (const auto& def : registry_.List()) {
        if (def->source != ToolSource::Discovered) continue;
        if (found_paths.count(def->source_path) > 0) continue;
        if (seen.count(def->name) > 0) continue;

        const auto path = fs::path(def->source_path);
        const bool in_scope = std::any_of(roots.begin(), roots.end(),
                                          [&](const fs::path& root) {
                                              return IsUnder(path, root);
                                          });
        if (!in_scope) continue;

        std::error_code ec;
        if (fs::exists(path, ec) && LooksLikeMcpTool(path)) continue;

        auto removed = registry_.Unregister(def->name);
        if (removed.IsErr()) {
            result.errors.emplace_back(def->source_path, removed.Error().message);
        } else {
            result.removed.push_back(def->name);
        }
    }

    LogInfo("discovery", "Discovery finished: " + std::to_string(result.added.size()) +
                             " new, " + std::to_string(result.updated.size()) +
                             " updated, " + std::to_string(result.removed.size()) +
                             " removed, " + std::to_string(result.errors.size()) +
                             " errors");
    return result;
}

} // namespace mcp_fleet
