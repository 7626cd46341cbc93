#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <string>
#include <vector>

#include "ReportSigner.h"
#include "ReportService.h"
#include "WipeSimulator.h"
#include "JsonModel.h"

namespace fs = std::filesystem;

// ==========================================
// 1. ПОДПИСЬ
// ==========================================

// Генерация RSA-2048: дорогая операция, ключи общие на весь набор тестов
class SignerTest : public ::testing::Test {
protected:
    static std::unique_ptr<SigningService> signer;
    static std::unique_ptr<SigningService> other;

    static void SetUpTestSuite() {
        signer = std::make_unique<SigningService>();
        signer->init();
        other = std::make_unique<SigningService>();
        other->init();
    }

    static void TearDownTestSuite() {
        signer.reset();
        other.reset();
    }
};

std::unique_ptr<SigningService> SignerTest::signer;
std::unique_ptr<SigningService> SignerTest::other;

TEST_F(SignerTest, Sign_And_Verify) {
    const std::string data = R"({"a":1})";
    std::string sig = signer->sign(data);
    EXPECT_FALSE(sig.empty());
    EXPECT_TRUE(SigningService::verify(data, sig, signer->public_key_pem()));
}

TEST_F(SignerTest, Tampered_Data_Fails) {
    std::string sig = signer->sign("payload");
    EXPECT_FALSE(SigningService::verify("payloae", sig, signer->public_key_pem()));
}

TEST_F(SignerTest, Foreign_Key_Fails) {
    std::string sig = signer->sign("payload");
    EXPECT_FALSE(SigningService::verify("payload", sig, other->public_key_pem()));
}

TEST_F(SignerTest, Garbage_Public_Key_Throws) {
    std::string sig = signer->sign("payload");
    EXPECT_THROW(SigningService::verify("payload", sig, "not a key"), SigningError);
}

TEST_F(SignerTest, Active_Key_Comparison) {
    EXPECT_TRUE(signer->is_active_key(signer->public_key_pem()));
    EXPECT_TRUE(signer->is_active_key(signer->public_key_pem() + "\n\n"));
    EXPECT_FALSE(signer->is_active_key(other->public_key_pem()));
}

TEST(SignerLifecycleTest, Sign_Before_Init_Throws) {
    SigningService svc;
    EXPECT_FALSE(svc.ready());
    EXPECT_THROW(svc.sign("x"), SigningError);
    EXPECT_FALSE(svc.is_active_key("anything"));
}

TEST(SignerLifecycleTest, Shutdown_Drops_Key) {
    SigningService svc;
    svc.init();
    EXPECT_TRUE(svc.ready());
    EXPECT_FALSE(svc.public_key_pem().empty());
    svc.shutdown();
    EXPECT_FALSE(svc.ready());
    EXPECT_TRUE(svc.public_key_pem().empty());
}

TEST(SignerLifecycleTest, Missing_Key_File_Throws) {
    SigningService svc;
    EXPECT_THROW(svc.init("/nonexistent/privascan/key.pem"), SigningError);
    EXPECT_FALSE(svc.ready());
}

TEST(Base64Test, Known_Values) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_decode("Zg=="), "f");
    EXPECT_EQ(base64_decode("Zm8="), "fo");
    EXPECT_EQ(base64_decode("Zm9vYmFy"), "foobar");
}

TEST(Base64Test, Binary_Bytes_Survive) {
    const std::string bytes("\0\xFF\x10\x80", 4);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

TEST(Base64Test, Invalid_Input_Throws) {
    EXPECT_THROW(base64_decode("abc"), SigningError);
    EXPECT_THROW(base64_decode("ab!?"), SigningError);
}

TEST(CanonicalTest, Keys_Sorted_And_Compact) {
    nlohmann::json j;
    j["zeta"] = 1;
    j["alpha"] = {{"b", true}, {"a", nullptr}};
    EXPECT_EQ(canonicalize(j), R"({"alpha":{"a":null,"b":true},"zeta":1})");
}

TEST(CanonicalTest, Invalid_Utf8_Is_Replaced) {
    nlohmann::json j = {{"name", std::string("a\xFF" "b")}};
    EXPECT_EQ(canonicalize(j), "{\"name\":\"a\xEF\xBF\xBD" "b\"}");
}

// ==========================================
// 2. ОТЧЁТЫ
// ==========================================

// Рендерер, который всегда падает: проверка "пара файлов целиком или ничего"
class FailingRenderer : public DocumentRenderer {
public:
    std::string extension() const override { return "pdf"; }
    void render(const nlohmann::json&, const std::string&, const std::string& path) const override {
        std::ofstream(path) << "partial";
        throw ReportError("renderer exploded");
    }
};

class RecordingEncoder : public TokenEncoder {
public:
    explicit RecordingEncoder(std::string* sink) : m_sink(sink) {}
    std::string encode(const std::string& token) const override {
        *m_sink = token;
        return "[" + token + "]";
    }
private:
    std::string* m_sink;
};

class ReportServiceTest : public SignerTest {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path()
                 / ("privascan_report_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    static nlohmann::json sample_scan_data() {
        Volume v;
        v.identifier = "Root";
        v.mount_path = "/";
        v.set_capacity(537109504000ULL, 161406156800ULL);
        nlohmann::json data;
        data["volumes"] = std::vector<Volume>{v};
        data["risk"] = {{"score", 65}, {"risk", "MEDIUM"}};
        data["note"] = "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";  // "привет"
        return data;
    }

    static nlohmann::json read_json(const std::string& path) {
        std::ifstream f(path);
        return nlohmann::json::parse(f);
    }

    static void write_json(const std::string& path, const nlohmann::json& j) {
        std::ofstream(path, std::ios::trunc) << j.dump(2);
    }

    size_t file_count() const {
        if (!fs::exists(temp_dir)) return 0;
        size_t n = 0;
        for (const auto& e : fs::directory_iterator(temp_dir)) { (void)e; ++n; }
        return n;
    }
};

TEST_F(ReportServiceTest, Generate_Then_Verify) {
    ReportService service(*signer, temp_dir.string());
    auto res = service.generate(sample_scan_data());

    ASSERT_TRUE(res.success) << res.error.value_or("");
    ASSERT_TRUE(res.report_id.has_value());
    ASSERT_TRUE(res.data_path.has_value());
    ASSERT_TRUE(res.document_path.has_value());
    EXPECT_TRUE(fs::exists(*res.data_path));
    EXPECT_TRUE(fs::exists(*res.document_path));
    EXPECT_NE(res.data_path->find("scan-report-" + *res.report_id + ".json"), std::string::npos);
    EXPECT_NE(res.document_path->find("scan-report-" + *res.report_id + ".txt"), std::string::npos);
    EXPECT_EQ(file_count(), 2u) << "Temporary files must not be left behind";

    auto report = read_json(*res.data_path);
    EXPECT_EQ(report["version"].get<std::string>(), REPORT_VERSION);
    EXPECT_EQ(report["signature"].get<std::string>(), *res.signature);
    EXPECT_EQ(report["scanData"]["volumes"][0]["usedGB"].get<std::string>(), "349.90");

    auto ver = service.verify(*res.data_path);
    EXPECT_TRUE(ver.valid) << ver.error.value_or("");
    EXPECT_EQ(ver.report_id, res.report_id);
    ASSERT_TRUE(ver.public_key_match.has_value());
    EXPECT_TRUE(*ver.public_key_match);
    EXPECT_FALSE(ver.error.has_value());
}

TEST_F(ReportServiceTest, Reports_Have_Unique_Ids) {
    ReportService service(*signer, temp_dir.string());
    auto a = service.generate(nlohmann::json::object());
    auto b = service.generate(nlohmann::json::object());
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_NE(*a.report_id, *b.report_id);
    EXPECT_EQ(file_count(), 4u);
}

TEST_F(ReportServiceTest, Tampered_Scan_Data_Is_Invalid) {
    ReportService service(*signer, temp_dir.string());
    auto res = service.generate(sample_scan_data());
    ASSERT_TRUE(res.success);

    auto report = read_json(*res.data_path);
    report["scanData"]["risk"]["score"] = 5;
    write_json(*res.data_path, report);

    auto ver = service.verify(*res.data_path);
    EXPECT_FALSE(ver.valid);
    EXPECT_FALSE(ver.error.has_value()) << "A bad signature is a verdict, not an error";
    EXPECT_TRUE(ver.public_key_match.value_or(false));
}

TEST_F(ReportServiceTest, Reformatted_File_Still_Verifies) {
    ReportService service(*signer, temp_dir.string());
    auto res = service.generate(sample_scan_data());
    ASSERT_TRUE(res.success);

    // Другой отступ и порядок ключей в файле не влияют на каноническую форму
    auto report = read_json(*res.data_path);
    std::ofstream(*res.data_path, std::ios::trunc) << report.dump();

    EXPECT_TRUE(service.verify(*res.data_path).valid);
}

TEST_F(ReportServiceTest, Other_Service_Key_Does_Not_Match) {
    ReportService producer(*signer, temp_dir.string());
    ReportService checker(*other, temp_dir.string());
    auto res = producer.generate(sample_scan_data());
    ASSERT_TRUE(res.success);

    auto ver = checker.verify(*res.data_path);
    EXPECT_TRUE(ver.valid) << "Embedded key still proves integrity";
    ASSERT_TRUE(ver.public_key_match.has_value());
    EXPECT_FALSE(*ver.public_key_match);
}

TEST_F(ReportServiceTest, Missing_File_Is_Error) {
    ReportService service(*signer, temp_dir.string());
    auto ver = service.verify((temp_dir / "nope.json").string());
    EXPECT_FALSE(ver.valid);
    ASSERT_TRUE(ver.error.has_value());
    EXPECT_FALSE(ver.report_id.has_value());
}

TEST_F(ReportServiceTest, Unsigned_And_Malformed_Files_Are_Errors) {
    fs::create_directories(temp_dir);
    ReportService service(*signer, temp_dir.string());

    const std::string unsigned_path = (temp_dir / "unsigned.json").string();
    write_json(unsigned_path, {{"reportId", "x"}, {"scanData", {}}});
    auto ver = service.verify(unsigned_path);
    EXPECT_FALSE(ver.valid);
    EXPECT_TRUE(ver.error.has_value());

    const std::string broken_path = (temp_dir / "broken.json").string();
    std::ofstream(broken_path) << "{ not json";
    ver = service.verify(broken_path);
    EXPECT_FALSE(ver.valid);
    EXPECT_TRUE(ver.error.has_value());

    const std::string bad_sig_path = (temp_dir / "bad_sig.json").string();
    write_json(bad_sig_path, {{"reportId", "x"}, {"signature", "%%%%"},
                              {"publicKey", signer->public_key_pem()}});
    ver = service.verify(bad_sig_path);
    EXPECT_FALSE(ver.valid);
    EXPECT_TRUE(ver.error.has_value());
}

TEST_F(ReportServiceTest, Uninitialized_Signer_Fails_Without_Files) {
    SigningService cold;
    ReportService service(cold, temp_dir.string());
    auto res = service.generate(sample_scan_data());
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(ReportServiceTest, Failed_Render_Leaves_No_Files) {
    ReportService service(*signer, temp_dir.string(), std::make_unique<FailingRenderer>());
    auto res = service.generate(sample_scan_data());
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_NE(res.error->find("renderer exploded"), std::string::npos);
    EXPECT_EQ(file_count(), 0u) << "Neither the data file nor the document may survive";
}

TEST_F(ReportServiceTest, Token_Goes_Through_Encoder) {
    std::string token;
    ReportService service(*signer, temp_dir.string(), nullptr, std::make_unique<RecordingEncoder>(&token));
    auto res = service.generate(sample_scan_data());
    ASSERT_TRUE(res.success);

    EXPECT_EQ(token, verification_token(*res.report_id, *res.signature));

    std::ifstream doc(*res.document_path);
    std::stringstream buf;
    buf << doc.rdbuf();
    EXPECT_NE(buf.str().find("[" + token + "]"), std::string::npos);
    EXPECT_NE(buf.str().find("Root"), std::string::npos);
}

TEST(VerificationTokenTest, Format) {
    EXPECT_EQ(verification_token("id-1", "ABCDEFGHIJKLMNOPQRSTUVWXYZ"), "id-1:ABCDEFGHIJKLMNOP");
    EXPECT_EQ(verification_token("id-2", "short"), "id-2:short");
}

TEST(TextEncoderTest, Token_Is_Framed) {
    TextTokenEncoder enc;
    std::string img = enc.encode("abc");
    EXPECT_NE(img.find("# abc #"), std::string::npos);
    EXPECT_EQ(img.rfind("#######", 0), 0u);
}

// ==========================================
// 3. ИМИТАЦИЯ УДАЛЕНИЯ
// ==========================================

TEST(WipeSimulatorTest, Publishes_Ordered_Events) {
    ProgressStream stream;
    std::vector<ProgressEvent> events;
    stream.subscribe([&](const ProgressEvent& e) { events.push_back(e); });

    auto last = WipeSimulator().run("/home/user/.bash_history", stream);

    ASSERT_EQ(events.size(), static_cast<size_t>(DEFAULT_WIPE_STEPS));
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].step, static_cast<int>(i) + 1);
        EXPECT_EQ(events[i].total_steps, DEFAULT_WIPE_STEPS);
        EXPECT_EQ(events[i].completed, i + 1 == events.size());
        if (i > 0) EXPECT_GT(events[i].progress_percent, events[i - 1].progress_percent);
    }
    EXPECT_DOUBLE_EQ(events[0].progress_percent, 20.0);
    EXPECT_DOUBLE_EQ(last.progress_percent, 100.0);
    EXPECT_TRUE(last.completed);
    EXPECT_NE(last.message.find(".bash_history"), std::string::npos);

    nlohmann::json j = last;
    EXPECT_EQ(j["totalSteps"].get<int>(), DEFAULT_WIPE_STEPS);
    EXPECT_TRUE(j["completed"].get<bool>());
}

TEST(WipeSimulatorTest, Percent_Has_One_Decimal) {
    ProgressStream stream;
    std::vector<double> percents;
    stream.subscribe([&](const ProgressEvent& e) { percents.push_back(e.progress_percent); });
    WipeSimulator().run("t", stream, 3);
    ASSERT_EQ(percents.size(), 3u);
    EXPECT_DOUBLE_EQ(percents[0], 33.3);
    EXPECT_DOUBLE_EQ(percents[1], 66.7);
    EXPECT_DOUBLE_EQ(percents[2], 100.0);
}

TEST(WipeSimulatorTest, Cancel_Stops_Stream) {
    ProgressStream stream;
    std::vector<ProgressEvent> events;
    stream.subscribe([&](const ProgressEvent& e) {
        events.push_back(e);
        if (e.step == 2) stream.cancel();
    });

    auto last = WipeSimulator().run("t", stream);
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(last.step, 2);
    EXPECT_FALSE(last.completed);
    EXPECT_TRUE(stream.cancelled());
}

TEST(WipeSimulatorTest, Unsubscribed_Handler_Gets_Nothing) {
    ProgressStream stream;
    int first = 0, second = 0;
    auto id = stream.subscribe([&](const ProgressEvent&) { ++first; });
    stream.subscribe([&](const ProgressEvent&) { ++second; });
    stream.unsubscribe(id);

    WipeSimulator().run("t", stream);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, DEFAULT_WIPE_STEPS);
}

TEST(WipeSimulatorTest, Nothing_Is_Deleted) {
    fs::path target = fs::temp_directory_path() / "privascan_wipe_target.txt";
    std::ofstream(target) << "keep me";

    ProgressStream stream;
    WipeSimulator().run(target.string(), stream);
    EXPECT_TRUE(fs::exists(target));

    std::error_code ec;
    fs::remove(target, ec);
}
