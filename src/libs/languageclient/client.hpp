// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "dynamiccapabilities.hpp"
#include "languageclient_global.hpp"
#include "languageclientsettings.hpp"
#include "lsperror.hpp"
#include "requestcorrelator.hpp"

#include <languageserverprotocol/basemessage.hpp>
#include <languageserverprotocol/jsonrpcmessages.hpp>
#include <languageserverprotocol/servercapabilities.hpp>

#include <QFuture>
#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QScopedPointer>

#include <optional>

namespace LspMux::LanguageClient {

class BaseClientInterface;

// An outstanding asynchronous request. The id is invalid if the request was refused locally.
struct PendingReply {
  LanguageServerProtocol::MessageId id;
  QFuture<Reply> future;
};

// Supervises one language server: starts it on demand, performs the initialize handshake, tracks
// its capabilities and the documents opened on it and correlates requests with their responses.
// All public functions are thread-safe. Blocking calls must not be made from the thread of the
// interface's event context unless that thread runs a Qt event loop.
class LSPMUX_CLIENT_EXPORT Client : public QObject {
  Q_OBJECT

public:
  Client(const BackendSettings &settings, BaseClientInterface *clientInterface); // takes ownership
  ~Client() override;
  Client(const Client &) = delete;
  Client(Client &&) = delete;

  auto operator=(const Client &) -> Client& = delete;
  auto operator=(Client &&) -> Client& = delete;

  enum State {
    NotStarted,
    Starting,
    Initializing,
    Ready,
    Failed,
    ShuttingDown,
    Stopped
  };
  Q_ENUM(State)

  // basic properties
  auto id() const -> QString { return m_settings.m_id; }
  auto settings() const -> const BackendSettings& { return m_settings; }
  auto setRequestTimeout(int msecs) -> void { m_requestTimeout = msecs; }
  auto setStartTimeout(int msecs) -> void { m_startTimeout = msecs; }
  auto setShutdownTimeout(int msecs) -> void { m_shutdownTimeout = msecs; }
  auto setExitGrace(int msecs) -> void { m_exitGrace = msecs; }

  // server state handling
  auto ensureStarted() -> std::optional<LspError>;
  auto stop() -> std::optional<LspError>;
  auto state() const -> State;
  auto stateString() const -> QString { return stateString(state()); }
  static auto stateString(State state) -> QString;
  auto failure() const -> std::optional<LspError>;

  // capabilities
  static auto defaultClientCapabilities() -> QJsonObject;
  auto capabilities() const -> LanguageServerProtocol::ServerCapabilities;
  auto dynamicCapabilities() const -> DynamicCapabilities;
  auto hasCapability(const QString &path) const -> bool;
  auto supportsMethod(const QString &method) const -> bool;
  auto serverName() const -> QString;
  auto serverVersion() const -> QString;

  // document synchronization
  auto ensureDocumentOpen(const QString &filePath, const QString &languageId) -> std::optional<LspError>;
  auto closeDocument(const QString &filePath) -> std::optional<LspError>;
  auto isDocumentOpen(const QString &filePath) const -> bool;
  auto documentVersion(const QString &filePath) const -> int;

  // messages; a negative timeout selects the configured request timeout
  auto request(const QString &method, const QJsonValue &params, int timeoutMsecs = -1) -> Reply;
  auto requestAsync(const QString &method, const QJsonValue &params, int timeoutMsecs = -1) -> PendingReply;
  auto cancelRequest(const LanguageServerProtocol::MessageId &id) -> bool;
  auto notify(const QString &method, const QJsonValue &params) -> std::optional<LspError>;
  auto pendingRequestCount() const -> int { return m_correlator.pendingCount(); }

  // Waits for a reply, spinning an event loop if the caller runs in the event context thread.
  auto waitForReply(const QFuture<Reply> &future) const -> Reply;

signals:
  auto notificationReceived(const QString &method, const QJsonValue &params) -> void;
  auto stateChanged(LspMux::LanguageClient::Client::State state) -> void;

private:
  struct OpenDocument {
    QString uri;
    QString languageId;
    int version = 1;
  };

  auto initializeParams() const -> QJsonObject;
  auto sendRequest(const QString &method, const QJsonValue &params, int timeoutMsecs) -> PendingReply;
  auto sendMessage(const LanguageServerProtocol::JsonRpcMessage &message) -> void;
  auto setState(State state) -> bool;
  auto setError(const LspError &error) -> void;
  auto handleMessage(const LanguageServerProtocol::BaseMessage &message) -> void;
  auto handleServerRequest(const LanguageServerProtocol::JsonRpcMessage &message) -> void;
  auto handleNotification(const LanguageServerProtocol::JsonRpcMessage &message) -> void;
  auto handleInterfaceError(const QString &message) -> void;
  auto handleInterfaceFinished() -> void;
  auto notReadyError(const QString &method) const -> LspError;
  static auto documentKey(const QString &filePath) -> QString;

  const BackendSettings m_settings;
  int m_requestTimeout = Constants::DEFAULT_REQUEST_TIMEOUT_MS;
  int m_startTimeout = Constants::DEFAULT_START_TIMEOUT_MS;
  int m_shutdownTimeout = Constants::DEFAULT_SHUTDOWN_TIMEOUT_MS;
  int m_exitGrace = Constants::DEFAULT_EXIT_GRACE_MS;

  mutable QMutex m_stateMutex;
  State m_state = NotStarted;
  std::optional<LspError> m_failure;
  LanguageServerProtocol::ServerCapabilities m_serverCapabilities;
  DynamicCapabilities m_dynamicCapabilities;
  QString m_serverName;
  QString m_serverVersion;

  QMutex m_startMutex;
  mutable QMutex m_documentMutex;
  QHash<QString, OpenDocument> m_openDocuments;

  // declared before the interface, so the interface and its timers are gone first
  RequestCorrelator m_correlator;
  QScopedPointer<BaseClientInterface> m_clientInterface;
};

} // namespace LspMux::LanguageClient
