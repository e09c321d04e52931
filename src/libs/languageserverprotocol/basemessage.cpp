// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "basemessage.hpp"

#include <QBuffer>

namespace LspMux::LanguageServerProtocol {

Q_LOGGING_CATEGORY(parseLog, "lspmux.protocol.parse", QtWarningMsg);

constexpr char headerFieldSeparator[] = ": ";
constexpr char contentLengthFieldName[] = "Content-Length";
constexpr char contentTypeFieldName[] = "Content-Type";
constexpr char headerSeparator[] = "\r\n";
constexpr char headerTerminator[] = "\r\n\r\n";

BaseMessage::BaseMessage(const QByteArray &content) : content(content), contentLength(content.size()) {}

auto BaseMessage::operator==(const BaseMessage &other) const -> bool
{
  return contentLength == other.contentLength && content == other.content;
}

static auto parseHeaderLine(const QByteArray &line, BaseMessage &message, QString &parseError) -> bool
{
  const auto colon = line.indexOf(':');
  if (colon <= 0) {
    parseError = BaseMessage::tr("Unexpected header line \"%1\".").arg(QString::fromLatin1(line));
    return false;
  }
  const auto name = line.left(colon).trimmed();
  const auto value = line.mid(colon + 1).trimmed();
  if (qstricmp(name.constData(), contentLengthFieldName) == 0) {
    bool ok = false;
    const auto length = value.toInt(&ok);
    if (!ok || length < 0) {
      parseError = BaseMessage::tr("Expected an integer in \"%1\", but got \"%2\".").arg(QString::fromLatin1(contentLengthFieldName), QString::fromLatin1(value));
      return false;
    }
    message.contentLength = length;
  } else if (qstricmp(name.constData(), contentTypeFieldName) == 0) {
    // the content type is fixed to JSON-RPC
    qCDebug(parseLog) << "ignoring content type" << value;
  } else {
    qCDebug(parseLog) << "ignoring unknown header" << name;
  }
  return true;
}

static auto parseHeader(const QByteArray &header, BaseMessage &message, QString &parseError) -> void
{
  for (const auto &line : header.split('\n')) {
    const auto trimmedLine = line.endsWith('\r') ? line.chopped(1) : line;
    if (trimmedLine.isEmpty())
      continue;
    if (!parseHeaderLine(trimmedLine, message, parseError))
      return;
  }
  if (message.contentLength < 0)
    parseError = BaseMessage::tr("Missing \"%1\" header.").arg(QString::fromLatin1(contentLengthFieldName));
}

auto BaseMessage::parse(QBuffer *data, QString &parseError, BaseMessage &message) -> void
{
  if (message.isValid()) {
    // the header is already known, only the remaining content is missing
    const auto missing = message.contentLength - message.content.size();
    message.content.append(data->read(missing));
    return;
  }

  const auto startPos = data->pos();
  const auto &buffer = data->buffer();
  const auto headerEnd = buffer.indexOf(headerTerminator, startPos);
  if (headerEnd < 0) {
    const auto firstLineEnd = buffer.indexOf(headerSeparator, startPos);
    if (firstLineEnd >= 0 && buffer.mid(startPos, firstLineEnd - startPos).indexOf(':') <= 0) {
      parseError = tr("Unexpected header line \"%1\".").arg(QString::fromLatin1(buffer.mid(startPos, firstLineEnd - startPos)));
    } else if (buffer.size() - startPos > maximumHeaderSize) {
      parseError = tr("Message header exceeds %1 bytes.").arg(maximumHeaderSize);
    }
    return;
  }

  BaseMessage parsed;
  parseHeader(buffer.mid(startPos, headerEnd - startPos), parsed, parseError);
  data->seek(headerEnd + qstrlen(headerTerminator));
  if (!parseError.isEmpty())
    return;
  parsed.content = data->read(parsed.contentLength);
  message = parsed;
}

auto BaseMessage::read(QIODevice *device, QString &parseError) -> std::optional<BaseMessage>
{
  BaseMessage message;
  QByteArray header;
  forever {
    auto line = device->readLine(maximumHeaderSize);
    if (line.isEmpty()) {
      if (!header.isEmpty())
        parseError = tr("Unexpected end of stream inside a message header.");
      return std::nullopt;
    }
    if (!line.endsWith('\n')) {
      parseError = tr("Unterminated header line \"%1\".").arg(QString::fromLatin1(line));
      return std::nullopt;
    }
    line.chop(1);
    if (line.endsWith('\r'))
      line.chop(1);
    if (line.isEmpty())
      break;
    header.append(line).append(headerSeparator);
    if (header.size() > maximumHeaderSize) {
      parseError = tr("Message header exceeds %1 bytes.").arg(maximumHeaderSize);
      return std::nullopt;
    }
  }

  parseHeader(header, message, parseError);
  if (!parseError.isEmpty())
    return std::nullopt;

  while (message.content.size() < message.contentLength) {
    const auto chunk = device->read(message.contentLength - message.content.size());
    if (chunk.isEmpty() && !device->waitForReadyRead(-1)) {
      parseError = tr("Unexpected end of stream: expected %1 content bytes, got %2.").arg(message.contentLength).arg(message.content.size());
      return std::nullopt;
    }
    message.content.append(chunk);
  }
  return message;
}

auto BaseMessage::isComplete() const -> bool
{
  if (!isValid())
    return false;
  return content.size() == contentLength;
}

auto BaseMessage::isValid() const -> bool
{
  return contentLength >= 0;
}

auto BaseMessage::header() const -> QByteArray
{
  QByteArray header;
  header.append(contentLengthFieldName);
  header.append(headerFieldSeparator);
  header.append(QByteArray::number(content.size()));
  header.append(headerTerminator);
  return header;
}

auto BaseMessage::toData() const -> QByteArray
{
  return header() + content;
}

} // namespace LspMux::LanguageServerProtocol
