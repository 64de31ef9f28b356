// File: src/embedding/embedding_provider.hpp
#pragma once

#include "core/deadline.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Abstract source of fixed-dimension text embeddings
///
/// Implementations wrap an external model (local runtime or network
/// service). They must honour the deadline: give up and return
/// std::nullopt rather than block past it. Throwing is tolerated; callers
/// treat any exception as "unavailable".
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /// Embed a piece of text
    /// @param text Input text
    /// @param deadline Point after which the result is no longer wanted
    /// @return Dense vector, or std::nullopt when the model is unavailable
    virtual std::optional<std::vector<float>> Embed(
        const std::string& text,
        Deadline deadline = Deadline::Never()) = 0;

    /// Cheap availability probe (model loaded, service reachable)
    virtual bool IsAvailable() const = 0;

    /// Output dimension, 0 when unknown
    virtual size_t Dimension() const = 0;

    /// Short identifier for logs
    virtual std::string Name() const = 0;
};

} // namespace aase
