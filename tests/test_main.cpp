#include <gtest/gtest.h>

#include "../src/http/client/curl_global.hpp"

namespace {
    class CurlEnvironment : public ::testing::Environment {
       public:
        void SetUp() override { curl_ = std::make_unique<fetchpool::client::CurlGlobal>(); }
        void TearDown() override { curl_.reset(); }

       private:
        std::unique_ptr<fetchpool::client::CurlGlobal> curl_;
    };
}  // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new CurlEnvironment);
    return RUN_ALL_TESTS();
}
