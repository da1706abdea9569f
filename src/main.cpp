#include "deskkit/app/Application.hpp"

#if defined(QT_STATIC) && defined(Q_OS_WIN)
#include <QtPlugin>
Q_IMPORT_PLUGIN(QWindowsIntegrationPlugin)
#endif

int main(int argc, char** argv) {
  deskkit::app::Application application(argc, argv);
  return application.run();
}
