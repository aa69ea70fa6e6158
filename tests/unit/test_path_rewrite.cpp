#include "devproxy/router/PathRewrite.h"
#include "devproxy/common/ConfigError.h"
#include "devproxy/common/Logger.h"
#include <cassert>
#include <string>

using namespace devproxy::router;
using namespace devproxy::common;

void testEmptyIsIdentity() {
    PathRewrite rw;
    assert(rw.empty());
    assert(rw.Apply("/api/users") == "/api/users");
    LOG_INFO << "Empty Rewrite PASS";
}

void testStripPrefix() {
    PathRewrite rw;
    rw.Add("^/api", "");
    assert(rw.Apply("/api/users") == "/users");
    assert(rw.Apply("/api") == "/");
    assert(rw.Apply("/other/api") == "/other/api");
    LOG_INFO << "Strip Prefix PASS";
}

void testCaretMatchesEverythingChangesNothing() {
    PathRewrite rw;
    rw.Add("^", "");
    assert(rw.Apply("/api/users?x") == "/api/users?x");
    assert(rw.Apply("/") == "/");
    LOG_INFO << "Caret Rewrite PASS";
}

void testFirstMatchWins() {
    PathRewrite rw;
    rw.Add("^/api/v1", "/v1");
    rw.Add("^/api", "/legacy");
    assert(rw.size() == 2);
    assert(rw.Apply("/api/v1/items") == "/v1/items");
    assert(rw.Apply("/api/items") == "/legacy/items");

    PathRewrite once;
    once.Add("a", "b");
    assert(once.Apply("/aaa") == "/baa");

    PathRewrite groups;
    groups.Add("^/user/([0-9]+)", "/users/$1/profile");
    assert(groups.Apply("/user/42") == "/users/42/profile");
    LOG_INFO << "First Match PASS";
}

void testValidation() {
    bool threw = false;
    try {
        PathRewrite rw;
        rw.Add("([a-z", "x");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    PathRewrite bad;
    bad.Add("^/api/", "");
    threw = false;
    try {
        bad.Validate("/api/index");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    PathRewrite spaces;
    spaces.Add("^/api", "/a b");
    threw = false;
    try {
        spaces.Validate("/api");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    PathRewrite ok;
    ok.Add("^/api", "/backend");
    ok.Validate("/api/index");

    assert(PathRewrite::IsValidPath("/"));
    assert(!PathRewrite::IsValidPath(""));
    assert(!PathRewrite::IsValidPath("api"));
    assert(!PathRewrite::IsValidPath("/a\x7f"));
    LOG_INFO << "Rewrite Validation PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testEmptyIsIdentity();
    testStripPrefix();
    testCaretMatchesEverythingChangesNothing();
    testFirstMatchWins();
    testValidation();
    return 0;
}
