// Token refresh over a shared cell.
//
// Requests read the session token from a cell. A request rejected with 401
// takes the token out, logs in again and puts the fresh token back, so any
// request issued meanwhile waits on read() instead of using a stale token.

#include <iostream>
#include <set>
#include <string>
#include <utility>

#include "mvar/mvar.hpp"

using namespace mvar;

namespace {

class auth_server {
public:
  std::string issue() {
    std::string token = "token-" + std::to_string(next_id_++);
    issued_.insert(token);
    return token;
  }

  bool valid(const std::string &token) const { return issued_.count(token) != 0; }

  void wipe() {
    issued_.clear();
    std::cout << "Tokens wiped." << std::endl;
  }

private:
  std::set<std::string> issued_;
  int next_id_ = 1000;
};

coro_task<std::string> login_request(auth_server &server) {
  std::cout << "Logging in" << std::endl;
  co_await yield();
  std::string token = server.issue();
  std::cout << "New token \"" << token << "\" issued." << std::endl;
  co_return token;
}

coro_task<void> login(cell<std::string> &session, auth_server &server) {
  std::string token = co_await login_request(server);
  co_await session.put_async(std::move(token));
}

coro_task<void> handle_logout(cell<std::string> &session, auth_server &server) {
  co_await session.take_async();
  std::string token = co_await login_request(server);
  co_await session.put_async(std::move(token));
}

coro_task<int> run_request(cell<std::string> &session, auth_server &server,
                           int id) {
  for (;;) {
    std::string token = co_await session.read_async();
    std::cout << "[" << id << "] Request with token " << token << "."
              << std::endl;
    co_await yield();

    int status = server.valid(token) ? 200 : 401;
    std::cout << "[" << id << "] " << status << std::endl;
    if (status != 401) {
      co_return status;
    }
    co_await handle_logout(session, server);
  }
}

} // namespace

MVAR_CORO_MAIN

mvar::coro_task<int> coro_main() {
  auth_server server;
  cell<std::string> session;

  // Issued before anyone has logged in: waits for the first token
  auto first = run_request(session, server, 1);
  first.start();
  co_await login(session, server);

  int failures = 0;
  if (co_await first != 200) {
    ++failures;
  }

  for (int id = 2; id <= 5; ++id) {
    if (id % 2 == 0) {
      server.wipe();
    }
    if (co_await run_request(session, server, id) != 200) {
      ++failures;
    }
  }

  std::cout << "Session ended with token " << session.read() << std::endl;
  co_return failures;
}
