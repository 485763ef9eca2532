/**
 * @file JsonResultRepository.hpp
 * @brief Writes per-document results as JSON files next to each other in an output directory.
 */

#pragma once
#include <string>
#include "domain/ResultRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace docweave::infrastructure {

/**
 * @class JsonResultRepository
 * @brief ResultRepository producing `<outputDir>/<documentId>.result.json`.
 *
 * Writes are queued on a shared PersistenceService; call its flush() before
 * reading the files back.
 */
class JsonResultRepository : public domain::ResultRepository {
public:
    JsonResultRepository(const std::string& outputDir, PersistenceService& persistence);

    bool saveResult(const domain::DocumentResult& result) override;
    bool writesDeferred() const override { return true; }

    /** @brief Path the result of `documentId` is written to. */
    std::string resultPath(const std::string& documentId) const;

    /** @brief Renders the stored JSON document for a result. */
    static std::string serialize(const domain::DocumentResult& result);

private:
    std::string m_outputDir;
    PersistenceService& m_persistence;
};

} // namespace docweave::infrastructure
