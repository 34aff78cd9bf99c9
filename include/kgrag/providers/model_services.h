#pragma once

#include <kgrag/providers/http_providers.h>
#include <kgrag/providers/model_handle.h>
#include <kgrag/providers/model_provider.h>

#include <functional>
#include <memory>
#include <string>

namespace kgrag::providers {

/**
 * @brief Owner of the process-wide model handles.
 *
 * Passed explicitly to the orchestrator; nothing in the library reaches for a
 * global. Each handle loads on first use.
 */
class ModelServices {
public:
    using EmbeddingLoader = ModelHandle<IEmbeddingProvider>::Loader;
    using CrossEncoderLoader = ModelHandle<ICrossEncoderProvider>::Loader;

    ModelServices(EmbeddingLoader embeddingLoader, CrossEncoderLoader crossEncoderLoader)
        : embedding_("embedding", std::move(embeddingLoader)),
          crossEncoder_("cross-encoder", std::move(crossEncoderLoader)) {}

    // Empty URLs leave the corresponding model unavailable.
    static std::shared_ptr<ModelServices> fromUrls(const std::string& embedUrl,
                                                   const std::string& rerankUrl,
                                                   HttpProviderOptions options = {});

    Result<std::shared_ptr<IEmbeddingProvider>> embedding() { return embedding_.get(); }
    Result<std::shared_ptr<ICrossEncoderProvider>> crossEncoder() { return crossEncoder_.get(); }

    ModelHandle<IEmbeddingProvider>& embeddingHandle() { return embedding_; }
    ModelHandle<ICrossEncoderProvider>& crossEncoderHandle() { return crossEncoder_; }

    void reset() {
        embedding_.reset();
        crossEncoder_.reset();
    }

private:
    ModelHandle<IEmbeddingProvider> embedding_;
    ModelHandle<ICrossEncoderProvider> crossEncoder_;
};

} // namespace kgrag::providers
