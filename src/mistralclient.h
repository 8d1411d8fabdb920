#pragma once
#include <QString>
#include <memory>
#include "llmextractor.h"

class QNetworkAccessManager;

namespace comptaflow {

// Chat-completions client for the Mistral API. Blocks on a local event loop,
// so a QCoreApplication must exist.
class MistralClient : public CompletionClient {
public:
    explicit MistralClient(const PipelineConfig &config);
    ~MistralClient() override;

    QString complete(const QString &prompt) override;

private:
    QString endpoint_;
    QString model_;
    QString apiKey_;
    double temperature_;
    int maxTokens_;
    std::unique_ptr<QNetworkAccessManager> netman_;
};

} // namespace comptaflow
