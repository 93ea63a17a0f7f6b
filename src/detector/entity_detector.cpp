#include "detector/entity_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace privgate {

// ============================================================================
// EntityModel
// ============================================================================

EntityModel& EntityModel::instance() {
    static EntityModel model;
    return model;
}

bool EntityModel::initialize(std::shared_ptr<const IEntityRecognizer> recognizer) {
    std::lock_guard lock(mutex_);
    if (recognizer_) {
        return false;
    }
    recognizer_ = std::move(recognizer);
    if (recognizer_) {
        utils::log::info(std::format("Entity model initialized: {}", recognizer_->name()));
    }
    return true;
}

std::shared_ptr<const IEntityRecognizer> EntityModel::get() const {
    std::lock_guard lock(mutex_);
    return recognizer_;
}

void EntityModel::reset() {
    std::lock_guard lock(mutex_);
    recognizer_.reset();
}

// ============================================================================
// Label mapping
// ============================================================================

std::optional<DetectorType> map_entity_label(std::string_view label) {
    static const std::unordered_map<std::string, DetectorType> lookup = {
        {"person", DetectorType::PERSON},
        {"per",    DetectorType::PERSON},
        {"org",    DetectorType::ORGANIZATION},
        {"gpe",    DetectorType::GEO_POLITICAL_ENTITY},
        {"loc",    DetectorType::LOCATION},
    };

    const auto it = lookup.find(utils::to_lower(label));
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// EntityDetector
// ============================================================================

EntityDetector::EntityDetector(std::shared_ptr<const IEntityRecognizer> recognizer)
    : recognizer_(std::move(recognizer)) {}

std::shared_ptr<const IEntityRecognizer> EntityDetector::recognizer() const {
    return recognizer_ ? recognizer_ : EntityModel::instance().get();
}

std::string EntityDetector::name() const {
    const auto r = recognizer();
    return r ? "entity:" + r->name() : "entity:none";
}

std::vector<Span> EntityDetector::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) return spans;

    const auto r = recognizer();
    if (!r) {
        utils::log::debug("Entity recognizer not initialized, skipping entity detection");
        return spans;
    }

    // DetectorUnavailableError propagates; the registry reports it and
    // treats this detector as having found nothing
    auto entities = r->recognize(text);

    spans.reserve(entities.size());
    for (auto& ent : entities) {
        const auto type = map_entity_label(ent.label);
        if (!type) continue;
        spans.emplace_back(*type, ent.start, ent.end, std::move(ent.text));
    }
    return spans;
}

} // namespace privgate
