#include "cloak/config.hpp"
#include "cloak/secret.hpp"
#include <gtest/gtest.h>
#include <functional>
#include <sstream>
#include <stdexcept>

using namespace cloak;

namespace {

struct Credentials {
    std::string user;
    std::string pass;

    bool operator==(const Credentials& o) const { return user == o.user && pass == o.pass; }
};

} // namespace

namespace cloak {

// user '\0' pass
template <>
struct ByteCodec<Credentials> {
    static size_t size(const Credentials& c) { return c.user.size() + 1 + c.pass.size(); }

    static void write(const Credentials& c, byte* out) {
        std::memcpy(out, c.user.data(), c.user.size());
        out[c.user.size()] = 0;
        std::memcpy(out + c.user.size() + 1, c.pass.data(), c.pass.size());
    }

    static Credentials read(const byte* in, size_t n) {
        const char* p = reinterpret_cast<const char*>(in);
        const size_t sep = std::string(p, n).find('\0');
        if (sep == std::string::npos) {
            throw std::invalid_argument("Credentials: missing separator");
        }
        return Credentials{ std::string(p, sep), std::string(p + sep + 1, n - sep - 1) };
    }

    static void scrub(Credentials& c) {
        ByteCodec<std::string>::scrub(c.user);
        ByteCodec<std::string>::scrub(c.pass);
    }
};

} // namespace cloak

namespace {

// Restores the process-wide config after each test
class SecretTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = config(); }
    void TearDown() override { set_config(saved_); }

    Config saved_;
};

// Strings whose decode always fails, with a std or a non-std exception
template <typename Failure>
struct FailingReadCodec : ByteCodec<std::string> {
    static std::string read(const byte*, size_t) { throw Failure{}; }
};

struct DecodeFailure : std::runtime_error {
    DecodeFailure() : std::runtime_error("decode failed") {}
};

struct NotAnException {};

using StdThrowingStrategy = BasicObfuscationStrategy<std::string, FailingReadCodec<DecodeFailure>>;
using RawThrowingStrategy = BasicObfuscationStrategy<std::string, FailingReadCodec<NotAnException>>;

} // namespace

// Persistent secret over an int: use keeps it alive, destroy ends it
TEST_F(SecretTest, IntScenario) {
    Secret<int> secret(42);

    Result<int> r = secret.use([](int x) { return x + 1; });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), 43);
    EXPECT_FALSE(secret.is_destroyed());

    secret.destroy();
    EXPECT_TRUE(secret.is_destroyed());

    Result<int> after = secret.use([](int x) { return x + 1; });
    ASSERT_FALSE(after.ok());
    EXPECT_THROW(after.value(), SecretNoLongerValid);
}

TEST_F(SecretTest, UseCanBeRepeatedWhileValid) {
    Secret<std::string> secret("my_password");

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(secret.use_e([](const std::string& v) { return v; }).value(), "my_password");
    }
    EXPECT_FALSE(secret.is_destroyed());
}

TEST_F(SecretTest, PostDestroyNeverInvokesCallback) {
    Secret<std::string> secret("token");
    secret.destroy();

    int calls = 0;
    for (int i = 0; i < 5; ++i) {
        Result<size_t> r = secret.eval_use([&calls](const std::string& v) -> Result<size_t> {
            ++calls;
            return v.size();
        });
        ASSERT_FALSE(r.ok());
        EXPECT_NE(std::string(r.error().what()).find("no longer valid"), std::string::npos);
    }
    EXPECT_EQ(calls, 0);
}

TEST_F(SecretTest, DestroyIsIdempotent) {
    Secret<std::string> secret("abc");
    secret.destroy();
    secret.destroy();
    secret.close();
    EXPECT_TRUE(secret.is_destroyed());
    EXPECT_EQ(secret.hash_code(), DESTROYED_HASH);
}

TEST_F(SecretTest, HashCodeSentinelAfterDestroy) {
    Secret<std::string> secret("value");
    EXPECT_GE(secret.hash_code(), 0);
    EXPECT_EQ(std::hash<Secret<std::string>>()(secret), static_cast<size_t>(secret.hash_code()));

    secret.destroy();
    EXPECT_EQ(secret.hash_code(), -1);
}

TEST_F(SecretTest, HashCodeDependsOnRandomKey) {
    const std::string plain(64, 'k');
    Secret<std::string> a(plain);
    Secret<std::string> b(plain);
    EXPECT_NE(a.hash_code(), b.hash_code());
}

TEST_F(SecretTest, GenericEqualityAlwaysFalse) {
    Secret<std::string> a("same");
    Secret<std::string> b("same");

    EXPECT_FALSE(a == b);
    EXPECT_FALSE(a == a);
    EXPECT_TRUE(a != a);
    EXPECT_TRUE(a != b);
}

TEST_F(SecretTest, IsEqualsComparesPlaintexts) {
    Secret<std::string> a("same");
    Secret<std::string> b("same");
    Secret<std::string> c("other");

    EXPECT_TRUE(a.is_equals(b));
    EXPECT_TRUE(a.is_equals(a));
    EXPECT_FALSE(a.is_equals(c));
    EXPECT_FALSE(a.is_destroyed());
    EXPECT_FALSE(b.is_destroyed());

    b.destroy();
    EXPECT_FALSE(a.is_equals(b));
    EXPECT_FALSE(b.is_equals(a));
}

TEST_F(SecretTest, ConstructionRejectsValuesOverSizeCap) {
    const std::string at_cap(MAX_SECRET_LEN, 'x');
    Secret<std::string> ok(at_cap);
    EXPECT_TRUE(ok.is_equals(ok));

    const std::string too_big(MAX_SECRET_LEN + 1, 'x');
    EXPECT_THROW(Secret<std::string>{ too_big }, std::length_error);
}

TEST_F(SecretTest, IsEqualsIsFalseWhenDecodeThrowsStdException) {
    Secret<std::string, StdThrowingStrategy> a("same");
    Secret<std::string, StdThrowingStrategy> b("same");

    EXPECT_FALSE(a.is_equals(b));
    EXPECT_FALSE(a.is_destroyed());
    EXPECT_FALSE(b.is_destroyed());
}

TEST_F(SecretTest, IsEqualsIsFalseWhenDecodeThrowsNonStdType) {
    Secret<std::string, RawThrowingStrategy> a("same");
    OneShotSecret<std::string, RawThrowingStrategy> b("same");

    EXPECT_FALSE(a.is_equals(b));
    EXPECT_FALSE(b.is_equals(a));
    EXPECT_FALSE(b.is_destroyed());
}

TEST_F(SecretTest, DisplayNeverShowsPlaintext) {
    Secret<std::string> secret("my_password");

    std::ostringstream os;
    os << secret;
    EXPECT_EQ(os.str(), SECRET_TAG);
    EXPECT_EQ(secret.to_string(), "** SECRET **");
    EXPECT_EQ(os.str().find("my_password"), std::string::npos);

    secret.destroy();
    std::ostringstream after;
    after << secret;
    EXPECT_EQ(after.str(), SECRET_TAG);
}

TEST_F(SecretTest, UseAndDestroyDestroysOnSuccess) {
    Secret<std::string> secret("once");

    Result<std::string> r = secret.use_and_destroy_e([](const std::string& v) { return v + "!"; });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), "once!");
    EXPECT_TRUE(secret.is_destroyed());
    EXPECT_FALSE(secret.use_e([](const std::string& v) { return v; }).ok());
}

TEST_F(SecretTest, EvalUseAndDestroyDestroysWhenEffectFails) {
    Secret<int> secret(7);

    Result<int> r = secret.eval_use_and_destroy([](int) -> Result<int> {
        return SecretNoLongerValid();
    });
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(secret.is_destroyed());
}

TEST_F(SecretTest, UseAndDestroyDestroysWhenCallbackThrows) {
    Secret<int> secret(7);

    EXPECT_THROW(
        secret.use_and_destroy([](int) -> int { throw std::runtime_error("boom"); }),
        std::runtime_error);
    EXPECT_TRUE(secret.is_destroyed());
}

TEST_F(SecretTest, UseAndDestroyOnDestroyedSecretFails) {
    Secret<int> secret(7);
    secret.destroy();

    bool called = false;
    Result<int> r = secret.use_and_destroy([&called](int x) { called = true; return x; });
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(called);
}

TEST_F(SecretTest, VoidCallbacks) {
    Secret<std::string> secret("v");
    std::string seen;

    Result<void> r = secret.use([&seen](const std::string& v) { seen = v; });
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(seen, "v");

    secret.destroy();
    Result<void> after = secret.use([&seen](const std::string&) { seen = "changed"; });
    EXPECT_FALSE(after.ok());
    EXPECT_THROW(after.value(), SecretNoLongerValid);
    EXPECT_EQ(seen, "v");
}

TEST_F(SecretTest, UnsafeUseThrowsAfterDestroy) {
    Secret<std::string> secret("raw");
    EXPECT_EQ(secret.unsafe_use([](const std::string& v) { return v.size(); }), 3u);

    secret.destroy();
    EXPECT_THROW(secret.unsafe_use([](const std::string& v) { return v.size(); }), SecretNoLongerValid);
}

TEST_F(SecretTest, DestructionLocationIsRecorded) {
    Config cfg = config();
    cfg.collect_destruction_location = true;
    set_config(cfg);

    Secret<std::string> secret("loc");
    EXPECT_FALSE(secret.destruction_location().has_value());

    secret.destroy();
    ASSERT_TRUE(secret.destruction_location().has_value());
    EXPECT_NE(std::string(secret.destruction_location()->file).find("test_secret.cpp"), std::string::npos);
    EXPECT_GT(secret.destruction_location()->line, 0);

    Result<int> r = secret.use([](const std::string&) { return 0; });
    ASSERT_FALSE(r.ok());
    ASSERT_TRUE(r.error().location().has_value());
    EXPECT_NE(std::string(r.error().what()).find("test_secret.cpp"), std::string::npos);
}

TEST_F(SecretTest, DestructionLocationCanBeDisabled) {
    Config cfg = config();
    cfg.collect_destruction_location = false;
    set_config(cfg);

    Secret<std::string> secret("loc");
    secret.destroy();
    EXPECT_FALSE(secret.destruction_location().has_value());

    Result<int> r = secret.use([](const std::string&) { return 0; });
    ASSERT_FALSE(r.ok());
    EXPECT_FALSE(r.error().location().has_value());
}

TEST_F(SecretTest, MoveLeavesSourceDestroyed) {
    Secret<std::string> a("moved");
    Secret<std::string> b(std::move(a));

    EXPECT_TRUE(a.is_destroyed());
    EXPECT_EQ(b.use_e([](const std::string& v) { return v; }).value(), "moved");

    Secret<std::string> c("other");
    c = std::move(b);
    EXPECT_TRUE(b.is_destroyed());
    EXPECT_EQ(c.use_e([](const std::string& v) { return v; }).value(), "moved");
}

TEST_F(SecretTest, RvalueConstructionScrubsSource) {
    std::string password = "hunter2";
    Secret<std::string> secret(std::move(password));

    EXPECT_TRUE(password.empty());
    EXPECT_EQ(secret.use_e([](const std::string& v) { return v; }).value(), "hunter2");
}

TEST_F(SecretTest, LvalueConstructionLeavesSourceAlone) {
    const std::string password = "hunter2";
    Secret<std::string> secret(password);
    EXPECT_EQ(password, "hunter2");
}

TEST_F(SecretTest, HashedTagIsDeterministic) {
    Secret<std::string> a("tag-me");
    Secret<std::string> b("tag-me");
    Secret<std::string> c("tag-you");

    EXPECT_EQ(a.hashed(), b.hashed());
    EXPECT_NE(a.hashed(), c.hashed());
    EXPECT_EQ(a.hashed(), secret_tag(std::string("tag-me")));
    EXPECT_EQ(a.hashed().find("tag-me"), std::string::npos);

    a.destroy();
    EXPECT_EQ(a.hashed(), b.hashed());
}

TEST_F(SecretTest, HasherCanBeChosenPerSecret) {
    Blake2bHasher blake;
    Secret<std::string> a("tag-me", blake);
    EXPECT_EQ(a.hashed(), blake.hash(std::string("tag-me")));
    EXPECT_NE(a.hashed(), secret_tag(std::string("tag-me")));
}

TEST_F(SecretTest, UserTypeWithCustomCodec) {
    Secret<Credentials> secret(Credentials{ "alice", "s3cret" });
    Secret<Credentials> same(Credentials{ "alice", "s3cret" });

    Result<std::string> user = secret.use([](const Credentials& c) { return c.user; });
    EXPECT_EQ(user.value(), "alice");
    EXPECT_TRUE(secret.is_equals(same));
}

TEST_F(SecretTest, FutureEffect) {
    Secret<int> secret(41);

    std::future<int> f = secret.use<std::future>([](int x) { return x + 1; });
    EXPECT_EQ(f.get(), 42);

    secret.destroy();
    std::future<int> failed = secret.use<std::future>([](int x) { return x + 1; });
    EXPECT_THROW(failed.get(), SecretNoLongerValid);
}

TEST_F(SecretTest, MakeSecretDeducesType) {
    auto secret = make_secret(std::string("deduced"));
    static_assert(std::is_same<decltype(secret), Secret<std::string>>::value, "Secret<std::string> expected");
    EXPECT_EQ(secret.use_e([](const std::string& v) { return v.size(); }).value(), 7u);
}
