#include "deskkit/logging/StreamCapture.hpp"

#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace deskkit::logging {

// Unbuffered streambuf: forwards every byte to the wrapped buffer and splits
// the same bytes into lines for the callback.
class StreamCapture::TeeBuffer final : public std::streambuf {
 public:
  using LineCallback = std::function<void(const QString&)>;

  TeeBuffer(std::streambuf* original, LineCallback onLine)
      : m_original(original), m_onLine(std::move(onLine)) {}

  // Emits whatever is left after the last newline.
  void flushPending() {
    std::string pending;
    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      pending.swap(m_line);
    }
    if (!pending.empty()) {
      m_onLine(QString::fromUtf8(pending.data(), static_cast<qsizetype>(pending.size())));
    }
  }

 protected:
  int_type overflow(int_type ch) override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
      return traits_type::not_eof(ch);
    }

    const char c = traits_type::to_char_type(ch);
    if (m_original != nullptr
        && traits_type::eq_int_type(m_original->sputc(c), traits_type::eof())) {
      return traits_type::eof();
    }
    consume(&c, 1);
    return ch;
  }

  std::streamsize xsputn(const char* data, std::streamsize count) override {
    std::streamsize written = count;
    if (m_original != nullptr) {
      written = m_original->sputn(data, count);
    }
    consume(data, count);
    return written;
  }

  int sync() override {
    return (m_original != nullptr) ? m_original->pubsync() : 0;
  }

 private:
  void consume(const char* data, std::streamsize count) {
    std::vector<std::string> completed;
    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      for (std::streamsize i = 0; i < count; ++i) {
        const char c = data[i];
        if (c == '\n') {
          if (!m_line.empty()) {
            completed.push_back(std::move(m_line));
          }
          m_line.clear();
        } else if (c != '\r') {
          m_line.push_back(c);
        }
      }
    }

    // Outside the lock: a receiver may itself write to the stream.
    for (const auto& line : completed) {
      m_onLine(QString::fromUtf8(line.data(), static_cast<qsizetype>(line.size())));
    }
  }

  std::streambuf* m_original = nullptr;
  LineCallback    m_onLine;
  std::mutex      m_mutex;
  std::string     m_line;
};

StreamCapture::StreamCapture(QObject* parent) : QObject(parent) {}

StreamCapture::~StreamCapture() {
  stopCapture();
}

void StreamCapture::startCapture() {
  if (m_capturing) {
    return;
  }

  m_originalStdout = std::cout.rdbuf();
  m_originalStderr = std::cerr.rdbuf();

  m_stdoutTee = std::make_unique<TeeBuffer>(
      m_originalStdout, [this](const QString& line) { emit outputCaptured(line, false); });
  m_stderrTee = std::make_unique<TeeBuffer>(
      m_originalStderr, [this](const QString& line) { emit outputCaptured(line, true); });

  std::cout.rdbuf(m_stdoutTee.get());
  std::cerr.rdbuf(m_stderrTee.get());

  m_capturing = true;
  emit captureStateChanged(true);
}

void StreamCapture::stopCapture() {
  if (!m_capturing) {
    return;
  }

  std::cout.flush();
  std::cerr.flush();
  std::cout.rdbuf(m_originalStdout);
  std::cerr.rdbuf(m_originalStderr);

  m_stdoutTee->flushPending();
  m_stderrTee->flushPending();
  m_stdoutTee.reset();
  m_stderrTee.reset();
  m_originalStdout = nullptr;
  m_originalStderr = nullptr;

  m_capturing = false;
  emit captureStateChanged(false);
}

bool StreamCapture::isCapturing() const noexcept {
  return m_capturing;
}

}  // namespace deskkit::logging
