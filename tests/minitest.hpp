#pragma once
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdlib>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };
// Thrown by SKIP(); reported separately from passes and failures.
struct Skipped : public std::runtime_error { using std::runtime_error::runtime_error; };

// Runs every registered test, or only those whose name contains filter.
inline int run_all(const std::string& filter = {}) {
  int failed = 0; int passed = 0; int skipped = 0;
  for (auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string::npos) continue;
    try {
      t.fn();
      ++passed;
      std::cout << "[PASS] " << t.name << "\n";
    } catch (const Skipped& s) {
      ++skipped;
      std::cout << "[SKIP] " << t.name << ": " << s.what() << "\n";
    } catch (const std::exception& e) {
      ++failed;
      std::cerr << "[FAIL] " << t.name << ": " << e.what() << "\n";
    }
  }
  std::cout << "\n" << passed << " passed, " << failed << " failed, " << skipped << " skipped\n";
  return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define SKIP(reason) throw ::mini::Skipped(reason)
#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if((expr)) throw ::mini::AssertionError(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
// OpResult helpers
#define ASSERT_OK(res) do { const auto& r_ = (res); if(!r_.ok) throw ::mini::AssertionError(std::string("ASSERT_OK failed: ") + #res + ": " + r_.message.utf8_string()); } while(0)
#define ASSERT_FAILS_WITH(res, k) do { const auto& r_ = (res); if(r_.ok || r_.kind != (k)) throw ::mini::AssertionError(std::string("ASSERT_FAILS_WITH failed: ") + #res " -> " #k); } while(0)
