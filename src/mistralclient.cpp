#include "mistralclient.h"
#include "logging.h"
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <stdexcept>

namespace comptaflow {

MistralClient::MistralClient(const PipelineConfig &config)
    : endpoint_(config.llmEndpoint),
      model_(config.llmModel),
      apiKey_(config.llmApiKey),
      temperature_(config.llmTemperature),
      maxTokens_(config.llmMaxTokens),
      netman_(new QNetworkAccessManager())
{
}

MistralClient::~MistralClient() = default;

QString MistralClient::complete(const QString &prompt) {
    if (apiKey_.isEmpty()) {
        throw std::runtime_error("LLM API key required.");
    }

    QJsonObject userMsg;
    userMsg["role"] = "user";
    userMsg["content"] = prompt;

    QJsonArray messages;
    messages.append(userMsg);

    QJsonObject payload;
    payload["model"] = model_;
    payload["messages"] = messages;
    payload["temperature"] = temperature_;
    payload["max_tokens"] = maxTokens_;

    QNetworkRequest req{QUrl(endpoint_)};
    req.setRawHeader("Authorization", QString("Bearer %1").arg(apiKey_).toUtf8());
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    qCDebug(lcLlm) << "POST" << endpoint_ << "model" << model_;
    QNetworkReply *reply = netman_->post(req, QJsonDocument(payload).toJson(QJsonDocument::Compact));
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();

    if (reply->error() != QNetworkReply::NoError) {
        QString err = reply->errorString();
        reply->deleteLater();
        throw std::runtime_error(err.toStdString());
    }

    QByteArray resp = reply->readAll();
    reply->deleteLater();

    QJsonDocument doc = QJsonDocument::fromJson(resp);
    if (!doc.isObject()) {
        throw std::runtime_error("Invalid response from LLM API.");
    }

    QJsonObject root = doc.object();
    QJsonArray choices = root["choices"].toArray();
    if (choices.isEmpty()) {
        throw std::runtime_error("LLM API returned no choices.");
    }

    return choices[0].toObject()["message"].toObject()["content"].toString().trimmed();
}

} // namespace comptaflow
