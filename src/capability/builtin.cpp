#include "geist/capability/builtin.hpp"
#include <stdexcept>

namespace geist {
namespace capability {

namespace {

template<typename Settings, typename Make>
CapabilityFactory make_factory(Make make) {
    return [make = std::move(make)](const nlohmann::json& j) -> Expected<std::shared_ptr<ICapability>> {
        auto settings = Settings::from_json(j);
        if (!settings) {
            return tl::unexpected(settings.error());
        }
        try {
            return make(std::move(*settings));
        } catch (const std::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, e.what()});
        }
    };
}

} // namespace

std::vector<CapabilityRegistration> builtin_capabilities(std::shared_ptr<transport::ITransport> transport) {
    return {
        {LogCapability::kName, make_factory<LogSettings>([](LogSettings s) {
            return std::shared_ptr<ICapability>(std::make_shared<LogCapability>(std::move(s)));
        })},
        {MarkdownFileCapability::kName, make_factory<MarkdownFileSettings>([](MarkdownFileSettings s) {
            return std::shared_ptr<ICapability>(std::make_shared<MarkdownFileCapability>(std::move(s)));
        })},
        {SearchCapability::kName, make_factory<SearchSettings>([transport](SearchSettings s) {
            return std::shared_ptr<ICapability>(std::make_shared<SearchCapability>(std::move(s), transport));
        })},
        {SendGridCapability::kName, make_factory<SendGridSettings>([transport](SendGridSettings s) {
            return std::shared_ptr<ICapability>(std::make_shared<SendGridCapability>(std::move(s), transport));
        })},
        {SmsCapability::kName, make_factory<SmsSettings>([transport](SmsSettings s) {
            return std::shared_ptr<ICapability>(std::make_shared<SmsCapability>(std::move(s), transport));
        })},
    };
}

} // namespace capability
} // namespace geist
