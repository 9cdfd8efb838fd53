#include "test_base.hpp"
#include "test_fakes.hpp"
#include "core/http_server_manager.hpp"
#include "web/route_handlers.hpp"

class RouteHandlersTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.api_key = "s3cret";
        config_.require_api_key_for_delete = true;
        config_.require_api_key_for_upload = false;
        config_.max_size_mb = 1;
        config_.allow_video = true;
    }

    void TearDown() override
    {
        if (server_)
            server_->stop();
        TestBase::TearDown();
    }

    // Start the full service stack on a free loopback port
    void startServer()
    {
        store_ = std::make_unique<AssetStore>(images_dir_, cache_dir_);
        codec_ = std::make_unique<KeyCodec>(config_.valid_sizes);
        transcoder_ = std::make_shared<OpenCvImageTranscoder>();
        classifier_ = std::make_unique<MediaClassifier>(config_, nullptr,
                                                        std::make_shared<FakeVideoSampler>(tmp_dir_, 5, 0));
        cache_ = std::make_unique<DerivativeCache>(*store_, *codec_, transcoder_, std::chrono::seconds(5));
        guard_ = std::make_unique<AccessGuard>(config_, std::make_shared<RateLimiter>());
        pipeline_ = std::make_unique<IngestionPipeline>(config_, *store_, *classifier_, transcoder_,
                                                        std::make_shared<FakeRemoteFetcher>());
        ctx_ = std::make_unique<ServiceContext>(ServiceContext{config_, *store_, *cache_, *guard_, *pipeline_});

        server_ = std::make_unique<HttpServerManager>([this](httplib::Server &svr)
                                                      { RouteHandlers::setupRoutes(svr, *ctx_); });
        HttpServerManager::Options options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.threads = 4;
        options.payload_max_length = static_cast<size_t>(config_.max_size_mb) * 1024 * 1024;
        server_->start(options);
        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->getBoundPort());
    }

    httplib::Result upload(const std::string &content, const std::string &filename)
    {
        httplib::MultipartFormDataItems items = {{"file", content, filename, "application/octet-stream"}};
        return client_->Post("/", items);
    }

    httplib::Result deleteAsset(const std::string &name, const std::string &token)
    {
        httplib::Headers headers;
        if (!token.empty())
            headers.emplace("Authorization", "Bearer " + token);
        return client_->Delete("/" + name, headers);
    }

    static json body(const httplib::Result &res)
    {
        return json::parse(res->body);
    }

    std::unique_ptr<AssetStore> store_;
    std::unique_ptr<KeyCodec> codec_;
    std::shared_ptr<ImageTranscoder> transcoder_;
    std::unique_ptr<MediaClassifier> classifier_;
    std::unique_ptr<DerivativeCache> cache_;
    std::unique_ptr<AccessGuard> guard_;
    std::unique_ptr<IngestionPipeline> pipeline_;
    std::unique_ptr<ServiceContext> ctx_;
    std::unique_ptr<HttpServerManager> server_;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(RouteHandlersTest, LivenessAndForm)
{
    startServer();

    auto live = client_->Get("/liveness");
    ASSERT_TRUE(live);
    EXPECT_EQ(live->status, 200);

    auto index = client_->Get("/");
    ASSERT_TRUE(index);
    EXPECT_EQ(index->status, 200);
    EXPECT_NE(index->body.find("multipart/form-data"), std::string::npos);
    EXPECT_EQ(index->get_header_value("Referrer-Policy"), "no-referrer-when-downgrade");
}

TEST_F(RouteHandlersTest, HiddenFormServesEmptyBody)
{
    config_.hide_upload_form = true;
    startServer();

    auto index = client_->Get("/");
    ASSERT_TRUE(index);
    EXPECT_EQ(index->status, 200);
    EXPECT_TRUE(index->body.empty());
}

TEST_F(RouteHandlersTest, UploadThenFetchOriginalAndDerivative)
{
    startServer();

    auto res = upload(encodeImage(40, 20, ".png"), "pic.png");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    std::string filename = body(res)["filename"].get<std::string>();
    EXPECT_EQ(FileUtils::getFileExtension(filename), "png");

    auto original = client_->Get("/" + filename);
    ASSERT_TRUE(original);
    EXPECT_EQ(original->status, 200);
    EXPECT_EQ(original->get_header_value("Content-Type"), "image/png");

    auto resized = client_->Get("/" + filename + "?w=10");
    ASSERT_TRUE(resized);
    EXPECT_EQ(resized->status, 200);
    std::vector<uchar> buffer(resized->body.begin(), resized->body.end());
    cv::Mat decoded = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    EXPECT_EQ(decoded.cols, 10);
    EXPECT_EQ(decoded.rows, 5);
    EXPECT_EQ(countFiles(cache_dir_), 1u);
}

TEST_F(RouteHandlersTest, UploadWithoutFileIsMissing)
{
    startServer();

    auto res = client_->Post("/", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(body(res)["error"].get<std::string>(), "File is missing!");
    EXPECT_EQ(body(res)["code"].get<std::string>(), "FILE_MISSING");
}

TEST_F(RouteHandlersTest, UploadOfTextIsUnsupported)
{
    startServer();

    auto res = upload("hello there", "notes.txt");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "UNSUPPORTED_FILE_TYPE");
}

TEST_F(RouteHandlersTest, OversizedUploadIs413)
{
    startServer();

    auto res = upload(std::string(2 * 1024 * 1024, 'a'), "big.png");
    // The server may close the connection before the client finishes sending
    if (res)
        EXPECT_EQ(res->status, 413);
    EXPECT_EQ(countFiles(images_dir_), 0u);
}

TEST_F(RouteHandlersTest, UploadRequiresTokenWhenConfigured)
{
    config_.require_api_key_for_upload = true;
    startServer();

    auto res = upload(encodeImage(8, 8, ".png"), "pic.png");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "AUTH_REQUIRED");
}

TEST_F(RouteHandlersTest, UnknownAssetIs404)
{
    startServer();

    auto res = client_->Get("/nothing-here.png");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "NOT_FOUND");
}

TEST_F(RouteHandlersTest, TraversalIsRejected)
{
    writeFile(root_ / "secret.txt", "top secret");
    startServer();

    auto res = client_->Get("/..%2Fsecret.txt");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(res->body.find("top secret"), std::string::npos);
}

TEST_F(RouteHandlersTest, InvalidSizeIs400)
{
    config_.valid_sizes = {100, 200};
    startServer();
    writeFile(images_dir_ / "pic.png", encodeImage(8, 8, ".png"));

    auto res = client_->Get("/pic.png?w=150");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "INVALID_SIZE");
}

TEST_F(RouteHandlersTest, MissingFileWithInvalidSizeIs404)
{
    config_.valid_sizes = {100, 200};
    startServer();

    auto res = client_->Get("/missing.png?w=999");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "NOT_FOUND");
}

TEST_F(RouteHandlersTest, DeleteRemovesOriginalAndDerivatives)
{
    startServer();
    writeFile(images_dir_ / "abc.png", encodeImage(8, 8, ".png"));
    writeFile(cache_dir_ / "abc_4x.png", "d1");
    writeFile(cache_dir_ / "abc_x4.png", "d2");

    auto res = deleteAsset("abc.png", "s3cret");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    EXPECT_EQ(body(res)["status"].get<std::string>(), "deleted");
    EXPECT_EQ(body(res)["cached_files_removed"].get<int>(), 2);
    EXPECT_FALSE(fs::exists(images_dir_ / "abc.png"));

    auto again = client_->Get("/abc.png");
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);
}

TEST_F(RouteHandlersTest, DeleteWithBadTokenIsRejectedThenRateLimited)
{
    config_.max_api_key_attempts_per_minute = 2;
    startServer();
    writeFile(images_dir_ / "abc.png", "x");

    for (int i = 0; i < 2; ++i)
    {
        auto res = deleteAsset("abc.png", "wrong");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 403);
        EXPECT_EQ(body(res)["code"].get<std::string>(), "INVALID_TOKEN");
    }
    auto limited = deleteAsset("abc.png", "wrong");
    ASSERT_TRUE(limited);
    EXPECT_EQ(limited->status, 429);
    EXPECT_TRUE(fs::exists(images_dir_ / "abc.png"));
}

TEST_F(RouteHandlersTest, DeleteDisabledWithoutSecret)
{
    config_.api_key.reset();
    startServer();
    writeFile(images_dir_ / "abc.png", "x");

    auto res = deleteAsset("abc.png", "anything");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_EQ(body(res)["code"].get<std::string>(), "ENDPOINT_DISABLED");
    EXPECT_TRUE(fs::exists(images_dir_ / "abc.png"));
}

TEST_F(RouteHandlersTest, MimeTypes)
{
    EXPECT_EQ(RouteHandlers::mimeType("jpg"), "image/jpeg");
    EXPECT_EQ(RouteHandlers::mimeType("svg"), "image/svg+xml");
    EXPECT_EQ(RouteHandlers::mimeType("mp4"), "video/mp4");
    EXPECT_EQ(RouteHandlers::mimeType("bin"), "application/octet-stream");
}
