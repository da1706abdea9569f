#pragma once

#include <QMainWindow>

namespace deskkit::ui {

class AboutWindow final : public QMainWindow {
 public:
  explicit AboutWindow(QWidget* parent = nullptr);
  ~AboutWindow() override;

 private:
  void     applyTheme();
  void     configureWindow();
  QWidget* buildCentralArea();
};

}  // namespace deskkit::ui
