#include "minitest.hpp"

#include <wx/init.h>
#include <wx/log.h>

int main(int argc, char** argv) {
  wxInitializer init;
  if (!init.IsOk()) {
    std::cerr << "Failed to initialize wxWidgets\n";
    return 1;
  }
  // Rejections are logged as warnings; keep test output readable.
  wxLog::SetLogLevel(wxLOG_Error);

  return mini::run_all(argc > 1 ? argv[1] : "");
}
