#include "rclogic/core/ClassifierConfig.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/DateTimeUtils.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace core {

namespace {

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    const size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

ClassifierConfig ClassifierConfig::standard() {
    ClassifierConfig config;
    config.date_formats = {
        "%Y-%m-%d", "%Y-%m-%d %H:%M", "%Y-%m-%d %H:%M:%S",
        "%d-%m-%Y", "%d-%m-%Y %H:%M", "%d-%m-%Y %H:%M:%S",
        "%m-%d-%Y", "%m-%d-%Y %H:%M", "%m-%d-%Y %H:%M:%S",
        "%H:%M", "%H:%M:%S"
    };
    return config;
}

void ClassifierConfig::validate() const {
    for (const auto& format : date_formats) {
        if (format.empty()) {
            RCLOGIC_THROW(ConfigException, "Empty date format");
        }
        if (auto bad = utils::DateTimeUtils::findInvalidDirective(format)) {
            RCLOGIC_THROW(ConfigException,
                          fmt::format("Unsupported directive '{}' in date format '{}'", *bad, format));
        }
    }
    if (missing_codes.count("") > 0) {
        RCLOGIC_THROW(ConfigException, "Missing-data codes must not contain the empty string");
    }
}

ClassifierConfig& ClassifierConfig::withMissingCodes(const std::vector<std::string>& codes) {
    missing_codes.insert(codes.begin(), codes.end());
    return *this;
}

ClassifierConfig& ClassifierConfig::withDateFormats(std::vector<std::string> formats) {
    date_formats = std::move(formats);
    return *this;
}

std::vector<std::string> ClassifierConfig::parseMissingDataCodes(std::string_view text) {
    std::vector<std::string> codes;
    size_t start = 0;
    while (start <= text.size()) {
        size_t bar = text.find('|', start);
        if (bar == std::string_view::npos) {
            bar = text.size();
        }
        std::string_view entry = text.substr(start, bar - start);
        const size_t comma = entry.find(',');
        std::string_view code = trim(entry.substr(0, comma));
        if (!code.empty()) {
            codes.emplace_back(code);
        }
        start = bar + 1;
    }
    return codes;
}

}} // namespace rclogic::core
