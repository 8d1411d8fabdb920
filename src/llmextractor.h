#pragma once
#include <QString>
#include <QVector>
#include <memory>
#include <optional>
#include "pipelineconfig.h"
#include "transaction.h"

namespace comptaflow {

// Prompt-to-text backend of a language model. Throws std::runtime_error on
// transport or protocol failure. One attempt, no retry.
class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual QString complete(const QString &prompt) = 0;
};

struct ParsedReply {
    QVector<TransactionCandidate> transactions;
    int rawCount = 0;
    int rejected = 0;
};

class LlmExtractor {
public:
    LlmExtractor(std::shared_ptr<CompletionClient> client, const PipelineConfig &config);

    // Never throws: transport and parsing failures come back as TierResult::error.
    TierResult extract(const QString &text, const std::optional<QString> &bankHint = std::nullopt) const;

    QString buildPrompt(const QString &text, const std::optional<QString> &bankHint) const;

    // Strips markdown fences, parses the first '[' .. last ']' span and
    // validates each record on its own. Throws std::runtime_error when no
    // JSON array can be read from the reply.
    static ParsedReply parseReply(const QString &reply, bool debug = false);

    bool available() const { return client_ != nullptr; }

private:
    std::shared_ptr<CompletionClient> client_;
    int charBudget_;
    bool debug_;
};

} // namespace comptaflow
