#pragma once

#include "../transport/itransport.hpp"
#include "capability.hpp"
#include "capability_registry.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geist {
namespace capability {

// ============================================================================
// LogAdapter
// ============================================================================

struct LogSettings {
    std::string filename;  ///< Empty selects geist_log_MMDDYYYY.txt for today

    static Expected<LogSettings> from_json(const nlohmann::json& j);
};

/**
 * @brief Appends agent output to a local log file.
 *
 * Actions: log(output), read_log() -> array of lines.
 */
class LogCapability : public Capability {
public:
    static constexpr const char* kName = "LogAdapter";

    explicit LogCapability(LogSettings settings = {});

    const std::string& filename() const { return filename_; }

    /** @brief geist_log_MMDDYYYY.txt for the local date. */
    static std::string default_filename();

private:
    void log(const std::string& output);
    std::vector<std::string> read_log() const;

    std::string filename_;
};

// ============================================================================
// MarkdownFileAdapter
// ============================================================================

struct MarkdownFileSettings {
    std::string file_root = ".";

    static Expected<MarkdownFileSettings> from_json(const nlohmann::json& j);
};

/**
 * @brief Reads and writes markdown files below a root directory.
 *
 * Actions: read_file(filename), write_file(filename, content) -> bool,
 * get_files() -> sorted relative paths of *.md / *.markdown files.
 * Paths that resolve outside the root are rejected.
 */
class MarkdownFileCapability : public Capability {
public:
    static constexpr const char* kName = "MarkdownFileAdapter";

    explicit MarkdownFileCapability(MarkdownFileSettings settings = {});

    const std::string& file_root() const { return file_root_; }

private:
    std::filesystem::path resolve(const std::string& filename) const;
    std::string read_file(const std::string& filename) const;
    bool write_file(const std::string& filename, const std::string& content) const;
    std::vector<std::string> get_files() const;

    std::string file_root_;
};

// ============================================================================
// SearchAdapter
// ============================================================================

struct SearchSettings {
    std::string base_url = "https://www.google.com";
    std::chrono::milliseconds timeout{30000};

    static Expected<SearchSettings> from_json(const nlohmann::json& j);
};

/**
 * @brief Web search and page fetch over HTTP GET.
 *
 * Actions: search(search_term), get(url). Non-200 responses yield the fixed
 * strings kSearchFailed / kGetFailed rather than an error.
 */
class SearchCapability : public Capability {
public:
    static constexpr const char* kName = "SearchAdapter";
    static constexpr const char* kSearchFailed = "Failed to retrieve search results";
    static constexpr const char* kGetFailed = "Failed to retrieve content";

    SearchCapability(SearchSettings settings, std::shared_ptr<transport::ITransport> transport);

private:
    std::string search(const std::string& search_term) const;
    std::string get(const std::string& url) const;

    SearchSettings settings_;
    std::shared_ptr<transport::ITransport> transport_;
};

// ============================================================================
// SendGridAdapter
// ============================================================================

struct SendGridSettings {
    std::string api_key;                          ///< Resolved from api_key_env when empty
    std::string api_key_env = "SENDGRID_API_KEY";
    std::string from_email;
    std::string from_name = "Geist";
    std::string endpoint = "https://api.sendgrid.com/v3/mail/send";
    std::chrono::milliseconds timeout{30000};

    Expected<void> validate() const;
    static Expected<SendGridSettings> from_json(const nlohmann::json& j);
};

/**
 * @brief Sends email through the SendGrid v3 mail API.
 *
 * Actions: send_email(to_email, subject, content[, to_name]) and
 * send_template_email(to_email, subject, template[, tokens, to_name,
 * is_markdown]). Both return a status string; 202 is success.
 */
class SendGridCapability : public Capability {
public:
    static constexpr const char* kName = "SendGridAdapter";
    static constexpr const char* kSent = "Email sent successfully";

    SendGridCapability(SendGridSettings settings, std::shared_ptr<transport::ITransport> transport);

    /** @brief Replace {{ token }} occurrences; unknown tokens are left as-is. */
    static std::string replace_tokens(const std::string& content, const nlohmann::json& tokens);

    /** @brief Headers, bold, italic, links and line breaks to HTML. */
    static std::string markdown_to_html(const std::string& markdown);

    /** @brief Content is treated as HTML if it contains both '<' and '>'. */
    static bool looks_like_html(const std::string& content);

private:
    std::string send_email(const std::string& to_email, const std::string& subject,
                           const std::string& content, const std::optional<std::string>& to_name) const;
    std::string send_template_email(const std::string& to_email, const std::string& subject,
                                    const std::string& template_text, const nlohmann::json& tokens,
                                    const std::optional<std::string>& to_name, bool is_markdown) const;

    SendGridSettings settings_;
    std::shared_ptr<transport::ITransport> transport_;
};

// ============================================================================
// SMSAdapter
// ============================================================================

struct SmsSettings {
    std::string account_sid;                      ///< Resolved from account_sid_env when empty
    std::string account_sid_env = "TWILIO_SID";
    std::string auth_token;                       ///< Resolved from auth_token_env when empty
    std::string auth_token_env = "TWILIO_TOKEN";
    std::string from_number;                      ///< Resolved from from_number_env when empty
    std::string from_number_env = "TWILIO_SOURCE";
    std::string endpoint = "https://api.twilio.com/2010-04-01";
    std::chrono::milliseconds timeout{30000};

    Expected<void> validate() const;
    static Expected<SmsSettings> from_json(const nlohmann::json& j);
};

/**
 * @brief Sends SMS and MMS through the Twilio Messages API.
 *
 * Actions: send_text(message, number) and send_media(message, number,
 * media_url). Both POST a form to {endpoint}/Accounts/{sid}/Messages.json
 * with basic auth and return the message SID on 201, otherwise a status
 * string.
 */
class SmsCapability : public Capability {
public:
    static constexpr const char* kName = "SMSAdapter";

    SmsCapability(SmsSettings settings, std::shared_ptr<transport::ITransport> transport);

    std::string messages_url() const;

private:
    std::string send(const std::string& message, const std::string& number,
                     const std::optional<std::string>& media_url) const;

    SmsSettings settings_;
    std::shared_ptr<transport::ITransport> transport_;
};

// ============================================================================
// Registration table
// ============================================================================

/**
 * @brief Static registration table of the built-in capabilities
 *
 * @param transport HTTP transport shared by the network-backed capabilities
 */
std::vector<CapabilityRegistration> builtin_capabilities(std::shared_ptr<transport::ITransport> transport);

} // namespace capability
} // namespace geist
