#include <gtest/gtest.h>
#include "protocols/http/HttpRouter.hpp"
#include "sync/TaskRegistry.hpp"
#include "sync/SyncTask.hpp"
#include "TempDir.hpp"

#include <nlohmann/json.hpp>

using namespace ds::http;
using namespace ds::sync;
using namespace std::chrono_literals;
using ds::test::TempDir;

class HttpRouterTest : public ::testing::Test {
protected:
    TempDir tmp;
    TaskRegistry registry;
    std::string id;

    void SetUp() override {
        id = registry.addTask("/srv/a", "/backup/a", 60s)->id();
        registry.addTask("/srv/b", "/backup/b", 60s);
    }

    static Request request(const http::verb verb, const std::string& target) {
        Request req{verb, target, 11};
        req.prepare_payload();
        return req;
    }

    static nlohmann::json body(const Response& res) { return nlohmann::json::parse(res.body()); }
};

TEST_F(HttpRouterTest, StatusListsAllTasks) {
    const HttpRouter router(registry);
    const auto res = router.route(request(http::verb::get, "/status"));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    const auto j = body(res);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0].at("id"), "/srv/a:/backup/a");
    EXPECT_EQ(j[1].at("source_path"), "/srv/b");
}

TEST_F(HttpRouterTest, StatusById) {
    const HttpRouter router(registry);

    const auto found = router.route(request(http::verb::get, "/status?id=%2Fsrv%2Fa%3A%2Fbackup%2Fa"));
    EXPECT_EQ(found.result(), http::status::ok);
    EXPECT_EQ(body(found).at("destination_path"), "/backup/a");

    const auto missing = router.route(request(http::verb::get, "/status?id=nope"));
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(body(missing), (nlohmann::json{{"success", false}, {"message", "Sync not found"}}));
}

TEST_F(HttpRouterTest, SyncNowTriggersAllOrOne) {
    const HttpRouter router(registry);
    registry.pauseById(id);

    const auto all = router.route(request(http::verb::post, "/api/sync/now"));
    EXPECT_EQ(all.result(), http::status::ok);
    EXPECT_EQ(body(all), (nlohmann::json{{"success", true}, {"message", "Sync triggered"}}));
    EXPECT_FALSE(registry.getById(id)->paused);

    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/now?id=" + id)).result(), http::status::ok);
    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/now?id=missing")).result(), http::status::not_found);
}

TEST_F(HttpRouterTest, PauseAndResume) {
    const HttpRouter router(registry);

    const auto paused = router.route(request(http::verb::post, "/api/sync/pause?id=" + id));
    EXPECT_EQ(paused.result(), http::status::ok);
    EXPECT_EQ(body(paused).at("success"), true);
    EXPECT_TRUE(registry.getById(id)->paused);

    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/resume?id=" + id)).result(), http::status::ok);
    EXPECT_FALSE(registry.getById(id)->paused);

    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/pause")).result(), http::status::bad_request);
    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/resume?id=")).result(), http::status::bad_request);
    EXPECT_EQ(router.route(request(http::verb::post, "/api/sync/pause?id=missing")).result(),
              http::status::not_found);
}

TEST_F(HttpRouterTest, WrongMethodsAreRejected) {
    const HttpRouter router(registry);
    EXPECT_EQ(router.route(request(http::verb::get, "/api/sync/now")).result(), http::status::method_not_allowed);
    EXPECT_EQ(router.route(request(http::verb::post, "/status")).result(), http::status::method_not_allowed);
    EXPECT_EQ(router.route(request(http::verb::delete_, "/index.html")).result(), http::status::method_not_allowed);
    EXPECT_EQ(router.route(request(http::verb::post, "/api/unknown")).result(), http::status::not_found);
}

TEST_F(HttpRouterTest, MalformedQueryIsBadRequest) {
    const HttpRouter router(registry);
    EXPECT_EQ(router.route(request(http::verb::get, "/status?id=%zz")).result(), http::status::bad_request);
}

TEST_F(HttpRouterTest, StaticServingDisabledByDefault) {
    const HttpRouter router(registry);
    EXPECT_EQ(router.route(request(http::verb::get, "/")).result(), http::status::not_found);
}

TEST_F(HttpRouterTest, ServesStaticFiles) {
    tmp.write("web/index.html", "<h1>dirsync</h1>");
    tmp.write("web/js/app.js", "console.log(1);");
    tmp.write("secret.txt", "no");
    const HttpRouter router(registry, tmp / "web");

    const auto index = router.route(request(http::verb::get, "/"));
    EXPECT_EQ(index.result(), http::status::ok);
    EXPECT_EQ(index.body(), "<h1>dirsync</h1>");
    EXPECT_EQ(index[http::field::content_type], "text/html; charset=utf-8");

    const auto js = router.route(request(http::verb::get, "/js/app.js"));
    EXPECT_EQ(js.result(), http::status::ok);
    EXPECT_EQ(js[http::field::content_type], "application/javascript");

    EXPECT_EQ(router.route(request(http::verb::get, "/missing.css")).result(), http::status::not_found);
    EXPECT_EQ(router.route(request(http::verb::get, "/../secret.txt")).result(), http::status::not_found);
    EXPECT_EQ(router.route(request(http::verb::get, "/%2e%2e/secret.txt")).result(), http::status::not_found);
}
