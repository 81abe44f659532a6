#include "geist/capability/builtin.hpp"
#include <spdlog/spdlog.h>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace geist {
namespace capability {

Expected<LogSettings> LogSettings::from_json(const nlohmann::json& j) {
    LogSettings settings;
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "LogAdapter settings must be an object"});
    }
    if (auto it = j.find("filename"); it != j.end()) {
        if (!it->is_string()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "LogAdapter.filename must be a string"});
        }
        settings.filename = it->get<std::string>();
    }
    return settings;
}

std::string LogCapability::default_filename() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char date[16];
    std::strftime(date, sizeof(date), "%m%d%Y", &local);
    return std::string("geist_log_") + date + ".txt";
}

LogCapability::LogCapability(LogSettings settings)
    : Capability(kName)
    , filename_(settings.filename.empty() ? default_filename() : std::move(settings.filename))
{
    auto& table = actions_table();
    table.register_action("log", "Append one line of output to the agent log",
                          {"output"},
                          [this](const std::string& output) { this->log(output); });
    table.register_action("read_log", "Return every line written to the agent log",
                          {},
                          [this]() { return read_log(); });
}

void LogCapability::log(const std::string& output) {
    std::ofstream file(filename_, std::ios::app);
    if (!file) {
        throw std::runtime_error("Cannot open log file: " + filename_);
    }
    file << output << '\n';
    file.flush();
    if (!file) {
        throw std::runtime_error("Cannot write log file: " + filename_);
    }
    spdlog::debug("LogAdapter wrote {} bytes to {}", output.size(), filename_);
}

std::vector<std::string> LogCapability::read_log() const {
    std::ifstream file(filename_);
    if (!file) {
        throw std::runtime_error("Cannot open log file: " + filename_);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace capability
} // namespace geist
