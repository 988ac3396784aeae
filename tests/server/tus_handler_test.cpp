#include "tus/events/event_bus.hpp"
#include "tus/events/events.hpp"
#include "tus/server/tus_handler.hpp"
#include "tus/store/memory_cache.hpp"
#include "tus/store/session_store.hpp"
#include "tus/upload/chunk_writer.hpp"
#include "tus/upload/metadata.hpp"
#include "tus/upload/service.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace fs = std::filesystem;
using tus::Error;
using tus::ErrorCode;
using tus::events::EventBus;
using tus::events::UploadFinishedEvent;
using tus::network::HttpMethod;
using tus::network::HttpRequest;
using tus::network::HttpResponse;
using tus::network::HttpStatus;
using tus::server::TusHandler;
using tus::store::MemoryCache;
using tus::store::SessionStore;
using tus::testing::bytes;
using tus::testing::create_temp_dir;
using tus::upload::ChunkWriter;
using tus::upload::UploadConfig;
using tus::upload::UploadService;
using tus::upload::encode_base64;

class TusHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("tus_handler");
        config_.upload_dir = root_ / "tmp";
        config_.destination_dir = root_ / "files";
        config_.max_file_size = 64;
        fs::create_directories(config_.destination_dir);

        sessions_ = std::make_unique<SessionStore>(cache_, config_.session_ttl);
        writer_ = std::make_unique<ChunkWriter>(config_.upload_dir);
        service_ = std::make_unique<UploadService>(config_, *sessions_, *writer_, bus_);
        handler_ = std::make_unique<TusHandler>(*service_);

        bus_.subscribe<UploadFinishedEvent>([this](const UploadFinishedEvent& e) { finished_.push_back(e); });
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static HttpRequest request(HttpMethod method, const std::string& url) {
        HttpRequest req;
        req.method = method;
        req.url = url;
        req.headers["Tus-Resumable"] = TusHandler::kTusResumable;
        return req;
    }

    HttpResponse create(std::uint64_t length, const std::string& filename = "") {
        auto req = request(HttpMethod::POST, "/files/");
        req.headers["Upload-Length"] = std::to_string(length);
        if (!filename.empty()) {
            req.headers["Upload-Metadata"] = "filename " + encode_base64(filename);
        }
        return handler_->dispatch(req);
    }

    // Resource path taken from the Location header of a 201
    std::string create_path(std::uint64_t length, const std::string& filename = "") {
        auto response = create(length, filename);
        EXPECT_EQ(response.status_code, 201);
        const auto location = response.get_header("Location");
        const auto pos = location.find("/files/");
        return pos == std::string::npos ? std::string() : location.substr(pos);
    }

    HttpResponse patch(const std::string& path, std::uint64_t offset, const std::string& data) {
        auto req = request(HttpMethod::PATCH, path);
        req.headers["Content-Type"] = TusHandler::kOffsetContentType;
        req.headers["Upload-Offset"] = std::to_string(offset);
        req.body = bytes(data);
        return handler_->dispatch(req);
    }

    fs::path root_;
    UploadConfig config_;
    MemoryCache cache_;
    EventBus bus_;
    std::unique_ptr<SessionStore> sessions_;
    std::unique_ptr<ChunkWriter> writer_;
    std::unique_ptr<UploadService> service_;
    std::unique_ptr<TusHandler> handler_;
    std::vector<UploadFinishedEvent> finished_;
};

TEST_F(TusHandlerTest, OptionsAdvertisesCapabilitiesWithoutVersionHeader) {
    HttpRequest req;
    req.method = HttpMethod::OPTIONS;
    req.url = "/files/";

    auto response = handler_->dispatch(req);
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Extension"), "creation,termination,file-check");
    EXPECT_EQ(response.get_header("Tus-Max-Size"), "64");
    EXPECT_EQ(response.get_header("Access-Control-Allow-Origin"), "*");
}

TEST_F(TusHandlerTest, MissingTusResumableIsPreconditionFailed) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers.erase("Tus-Resumable");
    req.headers["Upload-Length"] = "5";

    auto response = handler_->dispatch(req);
    EXPECT_EQ(response.status_code, 412);
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
}

TEST_F(TusHandlerTest, CreateReturnsAbsoluteLocationWhenHostKnown) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["Upload-Length"] = "5";
    req.headers["Host"] = "uploads.example:1080";

    auto response = handler_->dispatch(req);
    ASSERT_EQ(response.status_code, 201);
    const auto location = response.get_header("Location");
    EXPECT_EQ(location.rfind("http://uploads.example:1080/files/", 0), 0u);
    EXPECT_TRUE(UploadService::is_valid_resource_id(location.substr(location.rfind('/') + 1)));
}

TEST_F(TusHandlerTest, BareCollectionPathAlsoCreates) {
    auto req = request(HttpMethod::POST, "/files");
    req.headers["Upload-Length"] = "1";
    EXPECT_EQ(handler_->dispatch(req).status_code, 201);
}

TEST_F(TusHandlerTest, CreateRequiresValidUploadLength) {
    auto req = request(HttpMethod::POST, "/files/");
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);

    req.headers["Upload-Length"] = "-3";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);

    req.headers["Upload-Length"] = "12abc";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, DeferredLengthIsRejected) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["Upload-Defer-Length"] = "1";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, MalformedMetadataIsBadRequest) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["Upload-Length"] = "5";
    req.headers["Upload-Metadata"] = "filename not*base64";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, OversizedUploadIsTooLarge) {
    EXPECT_EQ(create(65).status_code, 413);
}

TEST_F(TusHandlerTest, HeadReportsProgress) {
    const auto path = create_path(10, "a.txt");
    ASSERT_EQ(patch(path, 0, "abcd").status_code, 204);

    auto response = handler_->dispatch(request(HttpMethod::HEAD, path));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.get_header("Upload-Offset"), "4");
    EXPECT_EQ(response.get_header("Upload-Length"), "10");
    EXPECT_TRUE(response.body.empty());
    EXPECT_EQ(response.get_header("Cache-Control"), "no-store");
    EXPECT_EQ(response.get_header("Upload-Metadata"), "filename " + encode_base64("a.txt"));
}

TEST_F(TusHandlerTest, HeadOmitsMetadataWhenNoneDeclared) {
    const auto path = create_path(3);
    auto response = handler_->dispatch(request(HttpMethod::HEAD, path));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(response.get_header("Upload-Metadata").empty());
}

TEST_F(TusHandlerTest, HeadOnUnknownUploadIsNotFound) {
    auto response = handler_->dispatch(request(HttpMethod::HEAD, "/files/00000000-0000-0000-0000-000000000000"));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_TRUE(response.body.empty());
}

TEST_F(TusHandlerTest, PatchCompletesUpload) {
    const auto path = create_path(6, "hello.txt");

    auto first = patch(path, 0, "hel");
    EXPECT_EQ(first.status_code, 204);
    EXPECT_EQ(first.get_header("Upload-Offset"), "3");

    auto second = patch(path, 3, "lo!");
    EXPECT_EQ(second.status_code, 204);
    EXPECT_EQ(second.get_header("Upload-Offset"), "6");

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].metadata.at("filename"), "hello.txt");
    EXPECT_EQ(tus::testing::read_file(finished_[0].final_path), "hello!");

    EXPECT_EQ(handler_->dispatch(request(HttpMethod::HEAD, path)).status_code, 404);
}

TEST_F(TusHandlerTest, PatchRequiresOffsetContentType) {
    const auto path = create_path(4);
    auto req = request(HttpMethod::PATCH, path);
    req.headers["Content-Type"] = "application/octet-stream";
    req.headers["Upload-Offset"] = "0";
    req.body = bytes("data");

    EXPECT_EQ(handler_->dispatch(req).status_code, 415);
}

TEST_F(TusHandlerTest, PatchRequiresUploadOffset) {
    const auto path = create_path(4);
    auto req = request(HttpMethod::PATCH, path);
    req.headers["Content-Type"] = TusHandler::kOffsetContentType;
    req.body = bytes("data");

    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, PatchAtWrongOffsetConflicts) {
    const auto path = create_path(8);
    ASSERT_EQ(patch(path, 0, "ab").status_code, 204);

    EXPECT_EQ(patch(path, 0, "ab").status_code, 409);
    EXPECT_EQ(patch(path, 5, "ab").status_code, 409);
}

TEST_F(TusHandlerTest, PatchOnUnknownUploadIsGone) {
    EXPECT_EQ(patch("/files/00000000-0000-0000-0000-000000000000", 0, "x").status_code, 410);
    EXPECT_EQ(patch("/files/not-an-id", 0, "x").status_code, 410);
}

TEST_F(TusHandlerTest, MethodOverrideTurnsPostIntoPatch) {
    const auto path = create_path(2);
    auto req = request(HttpMethod::POST, path);
    req.headers["X-HTTP-Method-Override"] = "patch";
    req.headers["Content-Type"] = TusHandler::kOffsetContentType;
    req.headers["Upload-Offset"] = "0";
    req.body = bytes("ok");

    auto response = handler_->dispatch(req);
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Upload-Offset"), "2");
}

TEST_F(TusHandlerTest, UnknownMethodOverrideIsBadRequest) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["X-HTTP-Method-Override"] = "BREW";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, MessageIdTravelsWithFinishedEvent) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["Upload-Length"] = "1";
    req.headers["Upload-Metadata"] = "filename " + encode_base64("m.txt");
    req.headers["Message-Id"] = encode_base64("msg-42");

    auto created = handler_->dispatch(req);
    ASSERT_EQ(created.status_code, 201);
    const auto location = created.get_header("Location");

    ASSERT_EQ(patch(location.substr(location.find("/files/")), 0, "z").status_code, 204);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].metadata.at("message_id"), "msg-42");
}

TEST_F(TusHandlerTest, InvalidMessageIdIsBadRequest) {
    auto req = request(HttpMethod::POST, "/files/");
    req.headers["Upload-Length"] = "1";
    req.headers["Message-Id"] = "%%%";
    EXPECT_EQ(handler_->dispatch(req).status_code, 400);
}

TEST_F(TusHandlerTest, ProbeReportsFinishedFiles) {
    auto probe = request(HttpMethod::GET, "/files/");
    probe.headers["Upload-Metadata"] = "filename " + encode_base64("Report.PDF");

    auto before = handler_->dispatch(probe);
    EXPECT_EQ(before.status_code, 200);
    EXPECT_EQ(before.get_header("Tus-File-Exists"), "false");

    const auto path = create_path(3, "report.pdf");
    ASSERT_EQ(patch(path, 0, "pdf").status_code, 204);

    auto after = handler_->dispatch(probe);
    EXPECT_EQ(after.status_code, 200);
    EXPECT_EQ(after.get_header("Tus-File-Exists"), "true");
    EXPECT_EQ(after.get_header("Tus-File-Name"), "Report.PDF");
}

TEST_F(TusHandlerTest, DeleteTerminatesUpload) {
    const auto path = create_path(5);

    EXPECT_EQ(handler_->dispatch(request(HttpMethod::DELETE_METHOD, path)).status_code, 204);
    EXPECT_EQ(handler_->dispatch(request(HttpMethod::DELETE_METHOD, path)).status_code, 410);
    EXPECT_EQ(patch(path, 0, "x").status_code, 410);
}

TEST_F(TusHandlerTest, UnsupportedMethodOnResourceIsNotAllowed) {
    const auto path = create_path(5);
    auto response = handler_->dispatch(request(HttpMethod::PUT, path));
    EXPECT_EQ(response.status_code, 405);
    EXPECT_FALSE(response.get_header("Allow").empty());
}

TEST(TusHandlerStatusTest, MapsErrorCodes) {
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::ProtocolViolation, ""}, HttpMethod::POST), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::Conflict, ""}, HttpMethod::PATCH), HttpStatus::CONFLICT);
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::Gone, ""}, HttpMethod::HEAD), HttpStatus::NOT_FOUND);
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::Gone, ""}, HttpMethod::PATCH), HttpStatus::GONE);
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::TooLarge, ""}, HttpMethod::POST), HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(TusHandler::status_for(Error{ErrorCode::InternalError, ""}, HttpMethod::PATCH),
              HttpStatus::INTERNAL_SERVER_ERROR);
}
