// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageserverprotocol_global.hpp"

#include <QByteArray>
#include <QCoreApplication>
#include <QLoggingCategory>

#include <optional>

QT_BEGIN_NAMESPACE
class QBuffer;
class QIODevice;
QT_END_NAMESPACE

namespace LspMux::LanguageServerProtocol {

LSPMUX_PROTOCOL_EXPORT Q_DECLARE_LOGGING_CATEGORY(parseLog)

// One LSP frame: "Content-Length: <n>\r\n\r\n" followed by n bytes of UTF-8 JSON.
class LSPMUX_PROTOCOL_EXPORT BaseMessage {
  Q_DECLARE_TR_FUNCTIONS(BaseMessage)

public:
  BaseMessage() = default;
  explicit BaseMessage(const QByteArray &content);

  auto operator==(const BaseMessage &other) const -> bool;

  // Incremental decoding from an accumulating buffer. A partially received message is kept in
  // 'message' and completed by later calls. A non-empty parseError means the stream cannot be
  // resynchronized.
  static auto parse(QBuffer *data, QString &parseError, BaseMessage &message) -> void;
  // Blocking decoding of exactly one message. Returns nothing on end of stream; parseError is set
  // when the stream ended inside a message or was malformed.
  static auto read(QIODevice *device, QString &parseError) -> std::optional<BaseMessage>;

  auto isComplete() const -> bool;
  auto isValid() const -> bool;
  auto header() const -> QByteArray;
  auto toData() const -> QByteArray;

  QByteArray content;
  int contentLength = -1;

  static constexpr int maximumHeaderSize = 8 * 1024;
};

} // namespace LspMux::LanguageServerProtocol
