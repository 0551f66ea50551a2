#include "rclogic/logic/LogicTranslator.hpp"
#include "rclogic/core/Exception.hpp"
#include "rclogic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace rclogic {
namespace logic {

namespace {

bool isBlankLogic(const std::string& logic) {
    return logic.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

void TranslatorOptions::validate() const {
    if (checkbox_separator.empty()) {
        RCLOGIC_THROW(core::ConfigException, "Checkbox separator must not be empty");
    }
    for (const auto& alias : field_aliases) {
        if (alias.first.empty() || alias.second.empty()) {
            RCLOGIC_THROW(core::ConfigException,
                          fmt::format("Field alias '{}' -> '{}' has an empty side", alias.first, alias.second));
        }
    }
}

LogicTranslator::LogicTranslator(TranslatorOptions options)
    : options_(std::move(options))
    , parser_(LogicGrammar::instance())
    , lowering_(options_)
    , cache_(options_.cache_capacity) {
    options_.validate();
}

std::shared_ptr<const CompiledPredicate> LogicTranslator::compile(const std::string& logic) const {
    ParseTree tree = parser_.parse(logic);
    LoweredLogic lowered = lowering_.lower(tree);

    LOGIC_DEBUG("Lowered '{}' to {}", logic, lowered.root->toString());
    return std::make_shared<const CompiledPredicate>(logic, std::move(lowered.root),
                                                     std::move(lowered.referenced_fields));
}

TranslationResult LogicTranslator::translate(const std::string& logic) {
    auto cached = cache_.get(logic);
    if (cached) {
        LOGIC_DEBUG("Predicate cache hit: '{}'", logic);
        return TranslationResult{*cached, (*cached)->referencedFields()};
    }

    LOGIC_DEBUG("Predicate cache miss: '{}'", logic);
    auto predicate = compile(logic);
    cache_.put(logic, predicate);
    return TranslationResult{predicate, predicate->referencedFields()};
}

core::Result<TranslationResult> LogicTranslator::tryTranslate(const std::string& logic) {
    try {
        return translate(logic);
    } catch (const core::RcLogicException& e) {
        return e.toError();
    }
}

BatchTranslation LogicTranslator::translateAll(const std::map<std::string, std::string>& logic_by_field) {
    BatchTranslation batch;
    for (const auto& entry : logic_by_field) {
        if (isBlankLogic(entry.second)) {
            batch.skipped.push_back(entry.first);
            continue;
        }

        auto result = tryTranslate(entry.second);
        if (result.hasValue()) {
            batch.translated.emplace(entry.first, std::move(result.value()));
        } else {
            LOGIC_WARN("Skipping branching logic of field '{}': {}", entry.first, result.error().fullMessage());
            batch.failed.emplace(entry.first, result.error());
        }
    }

    LOGIC_INFO("Translated {} branching logic entries ({} failed, {} blank)",
               batch.translated.size(), batch.failed.size(), batch.skipped.size());
    return batch;
}

columnar::BooleanMask LogicTranslator::evaluate(const std::string& logic, const columnar::DataTable& table) {
    return translate(logic).predicate->evaluate(table);
}

}} // namespace rclogic::logic
