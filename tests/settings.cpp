#include <cassert>
#include <cstdlib>
#include "apischema/logging.hpp"
#include "apischema/resolver/handlers.hpp"
#include "apischema/resolver/resolver.hpp"
#include "apischema/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

int main() {
  using namespace apischema;
  // Defaults
  Settings d;
  assert(d.log_level == "WARNING");
  assert(d.http_connect_timeout_ms == 5000);
  assert(d.http_read_timeout_ms == 10000);
  assert(!d.http_follow_redirects);
  assert(d.strict_local_refs);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","debug"},{"http_read_timeout_ms",250},{"strict_local_refs",false}});
  assert(s.log_level == "debug");
  assert(s.http_read_timeout_ms == 250);
  assert(s.http_connect_timeout_ms == 5000);
  assert(s.strict_local_refs == false);

  auto fetch = resolver::fetch_options(s);
  assert(fetch.read_timeout_ms == 250);
  assert(fetch.connect_timeout_ms == 5000);
  assert(!fetch.follow_redirects);
  assert(!resolver::ResolverOptions::from_settings(s).strict_local_refs);

  // Env parse (set locally)
  set_env("APISCHEMA_LOG_LEVEL","debug");
  set_env("APISCHEMA_HTTP_CONNECT_TIMEOUT_MS","750");
  set_env("APISCHEMA_HTTP_READ_TIMEOUT_MS","not-a-number");
  set_env("APISCHEMA_HTTP_FOLLOW_REDIRECTS","true");
  set_env("APISCHEMA_STRICT_LOCAL_REFS","0");
  auto e = Settings::from_env();
  assert(e.log_level == "DEBUG"); // uppercased
  assert(e.http_connect_timeout_ms == 750);
  assert(e.http_read_timeout_ms == 10000); // unparseable values keep the default
  assert(e.http_follow_redirects == true);
  assert(e.strict_local_refs == false);

  e.apply_logging();
  assert(logging::level() == logging::LogLevel::Debug);
  Settings{}.apply_logging();
  assert(logging::level() == logging::LogLevel::Warning);
  return 0;
}
