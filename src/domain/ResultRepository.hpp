/**
 * @file ResultRepository.hpp
 * @brief Interface for the persistence collaborator.
 */

#pragma once
#include "DocumentResult.hpp"

namespace docweave::domain {

/**
 * @class ResultRepository
 * @brief Stores the final chunks, associations and quality metrics of a document.
 *
 * The pipeline knows nothing about the storage schema beyond these value sets.
 */
class ResultRepository {
public:
    virtual ~ResultRepository() = default;

    /**
     * @brief Saves one document's results.
     * @return False if the result could not be handed to storage.
     */
    virtual bool saveResult(const DocumentResult& result) = 0;

    /** @brief True when saveResult only queues the write; failures surface later in the storage layer. */
    virtual bool writesDeferred() const { return false; }
};

} // namespace docweave::domain
