#include <kgrag/providers/model_services.h>

namespace kgrag::providers {

std::shared_ptr<ModelServices> ModelServices::fromUrls(const std::string& embedUrl,
                                                       const std::string& rerankUrl,
                                                       HttpProviderOptions options) {
    EmbeddingLoader embeddingLoader = [embedUrl,
                                       options]() -> Result<std::shared_ptr<IEmbeddingProvider>> {
        if (embedUrl.empty())
            return Error{ErrorCode::ProviderUnavailable, "no embedding service configured"};
        auto provider = HttpEmbeddingProvider::connect(embedUrl, options);
        if (!provider)
            return provider.error();
        return std::shared_ptr<IEmbeddingProvider>(provider.value());
    };

    CrossEncoderLoader crossEncoderLoader =
        [rerankUrl, options]() -> Result<std::shared_ptr<ICrossEncoderProvider>> {
        if (rerankUrl.empty())
            return Error{ErrorCode::ProviderUnavailable, "no rerank service configured"};
        auto provider = HttpCrossEncoderProvider::connect(rerankUrl, options);
        if (!provider)
            return provider.error();
        return std::shared_ptr<ICrossEncoderProvider>(provider.value());
    };

    return std::make_shared<ModelServices>(std::move(embeddingLoader),
                                           std::move(crossEncoderLoader));
}

} // namespace kgrag::providers
