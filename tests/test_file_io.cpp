#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "stratai/util/file_io.h"

#define SAI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "stratai_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Parent directories are created on demand.
  const fs::path target = dir / "exports" / "history.csv";
  stratai::write_text_file(target.string(), "tick\n1\n");
  SAI_ASSERT(stratai::read_text_file(target.string()) == "tick\n1\n");

  // Overwrite goes through a temp sibling + rename.
  stratai::write_text_file(target.string(), "tick\n2\n");
  SAI_ASSERT(stratai::read_text_file(target.string()) == "tick\n2\n");

  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    SAI_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  // ensure_dir is idempotent.
  stratai::ensure_dir((dir / "nested" / "a").string());
  stratai::ensure_dir((dir / "nested" / "a").string());
  SAI_ASSERT(fs::is_directory(dir / "nested" / "a"));

  bool threw = false;
  try {
    (void)stratai::read_text_file((dir / "does_not_exist.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SAI_ASSERT(threw);

  fs::remove_all(dir, ec);
  return 0;
}
