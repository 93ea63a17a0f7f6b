#pragma once

#include "detector/idetector.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace privgate {

/**
 * @brief One entity reported by a recognizer, using the recognizer's labels
 */
struct RecognizedEntity {
    std::string label;   // e.g. "PERSON", "ORG", "GPE", "LOC"
    size_t start = 0;
    size_t end = 0;
    std::string text;
};

/**
 * @brief Entity-recognition collaborator
 *
 * Implementations may block (model inference, network). They must be safe
 * for concurrent read-only use once constructed, and throw
 * DetectorUnavailableError when the backing resource cannot answer.
 */
class IEntityRecognizer {
public:
    virtual ~IEntityRecognizer() = default;

    [[nodiscard]] virtual std::vector<RecognizedEntity> recognize(std::string_view text) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Process-wide holder of the heavyweight recognizer
 *
 * Initialized explicitly once at startup, then read-only. Lookups return a
 * shared_ptr copy, so a recognizer stays alive for in-flight submissions
 * even if reset() runs (tests only).
 */
class EntityModel {
public:
    static EntityModel& instance();

    /**
     * @brief Install the recognizer. Returns false if one is already set.
     */
    bool initialize(std::shared_ptr<const IEntityRecognizer> recognizer);

    [[nodiscard]] std::shared_ptr<const IEntityRecognizer> get() const;
    [[nodiscard]] bool is_initialized() const { return get() != nullptr; }

    /// Drop the recognizer (test isolation)
    void reset();

    EntityModel(const EntityModel&) = delete;
    EntityModel& operator=(const EntityModel&) = delete;

private:
    EntityModel() = default;

    mutable std::mutex mutex_;
    std::shared_ptr<const IEntityRecognizer> recognizer_;
};

/**
 * @brief Map a recognizer label to a DetectorType (case-insensitive).
 * Unknown labels map to nullopt and are dropped.
 */
[[nodiscard]] std::optional<DetectorType> map_entity_label(std::string_view label);

/**
 * @brief Detector adapter over an IEntityRecognizer
 *
 * Without an explicit recognizer it uses EntityModel::instance(). If none is
 * installed, detect() returns no spans. A DetectorUnavailableError from the
 * recognizer propagates to DetectorRegistry, which records a warning and
 * keeps the other detectors' candidates.
 */
class EntityDetector : public IDetector {
public:
    EntityDetector() = default;
    explicit EntityDetector(std::shared_ptr<const IEntityRecognizer> recognizer);

    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;
    [[nodiscard]] std::string name() const override;

private:
    [[nodiscard]] std::shared_ptr<const IEntityRecognizer> recognizer() const;

    std::shared_ptr<const IEntityRecognizer> recognizer_;
};

} // namespace privgate
