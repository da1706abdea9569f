#pragma once

#include <QObject>
#include <QString>

#include <memory>
#include <streambuf>

namespace deskkit::logging {

// Opt-in tee of std::cout / std::cerr. Output still reaches the original
// streams; complete lines are additionally reported through outputCaptured.
// Captured text is whatever the process prints, secrets included.
class StreamCapture final : public QObject {
  Q_OBJECT

 public:
  explicit StreamCapture(QObject* parent = nullptr);
  ~StreamCapture() override;

  void               startCapture();
  void               stopCapture();
  [[nodiscard]] bool isCapturing() const noexcept;

 signals:
  void outputCaptured(const QString& text, bool isError);
  void captureStateChanged(bool capturing);

 private:
  class TeeBuffer;

  std::unique_ptr<TeeBuffer> m_stdoutTee;
  std::unique_ptr<TeeBuffer> m_stderrTee;
  std::streambuf*            m_originalStdout = nullptr;
  std::streambuf*            m_originalStderr = nullptr;
  bool                       m_capturing      = false;
};

}  // namespace deskkit::logging
