#include "geist/capability/builtin.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace geist {
namespace capability {

namespace fs = std::filesystem;

namespace {

bool is_markdown_file(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".md" || ext == ".markdown";
}

} // namespace

Expected<MarkdownFileSettings> MarkdownFileSettings::from_json(const nlohmann::json& j) {
    MarkdownFileSettings settings;
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "MarkdownFileAdapter settings must be an object"});
    }
    if (auto it = j.find("file_root"); it != j.end()) {
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "MarkdownFileAdapter.file_root must be a non-empty string"
            });
        }
        settings.file_root = it->get<std::string>();
    }
    return settings;
}

MarkdownFileCapability::MarkdownFileCapability(MarkdownFileSettings settings)
    : Capability(kName)
{
    std::error_code ec;
    fs::path root = fs::absolute(settings.file_root, ec);
    if (ec) {
        root = settings.file_root;
    }
    root = root.lexically_normal();
    if (!root.has_filename() && root.has_parent_path()) {
        root = root.parent_path();
    }
    file_root_ = root.string();

    fs::create_directories(file_root_, ec);
    if (ec) {
        spdlog::warn("MarkdownFileAdapter could not create {}: {}", file_root_, ec.message());
    }

    auto& table = actions_table();
    table.register_action("read_file", "Read a markdown file relative to the file root",
                          {"filename"},
                          [this](const std::string& filename) { return read_file(filename); });
    table.register_action("write_file", "Write content to a markdown file relative to the file root",
                          {"filename", "content"},
                          [this](const std::string& filename, const std::string& content) {
                              return write_file(filename, content);
                          });
    table.register_action("get_files", "List markdown files below the file root",
                          {},
                          [this]() { return get_files(); });
}

fs::path MarkdownFileCapability::resolve(const std::string& filename) const {
    if (filename.empty()) {
        throw std::invalid_argument("filename cannot be empty");
    }
    const fs::path root(file_root_);
    const fs::path full = (root / filename).lexically_normal();
    const fs::path relative = full.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        throw std::invalid_argument("Path escapes file root: " + filename);
    }
    return full;
}

std::string MarkdownFileCapability::read_file(const std::string& filename) const {
    const fs::path path = resolve(filename);
    if (!fs::exists(path)) {
        throw std::runtime_error("File not found: " + filename);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Error reading file " + filename);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool MarkdownFileCapability::write_file(const std::string& filename, const std::string& content) const {
    const fs::path path = resolve(filename);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        spdlog::warn("Error writing file {}: {}", filename, ec.message());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::warn("Error writing file {}: cannot open", filename);
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

std::vector<std::string> MarkdownFileCapability::get_files() const {
    std::vector<std::string> files;
    const fs::path root(file_root_);

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return files;
    }

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && is_markdown_file(it->path())) {
            files.push_back(it->path().lexically_relative(root).string());
        }
    }
    if (ec) {
        spdlog::warn("Error listing files in {}: {}", file_root_, ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace capability
} // namespace geist
