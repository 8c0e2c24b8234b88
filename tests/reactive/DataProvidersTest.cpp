#include "reactive/DataProviders.h"
#include <gtest/gtest.h>
#include <string>

#include "mocks/RecordingObserver.h"

namespace SPC {

using SPC::Test::RecordingObserver;

class DataProvidersTest : public ::testing::Test {
protected:
    static AsyncResult<std::string> describe(const int &value) {
        return AsyncResult<std::string>::success("value=" + std::to_string(value));
    }
};

TEST_F(DataProvidersTest, InMemoryProviderHoldsSuccess) {
    auto provider = DataProviders::createInMemoryProvider("memory", std::string("fixed"));
    EXPECT_EQ(provider->getCurrent(), AsyncResult<std::string>::success("fixed"));
    EXPECT_EQ(provider->getId(), "memory");
}

TEST_F(DataProvidersTest, TransformNestedAppliesTransformToCurrentValue) {
    auto base = ResultCell<int>::create("base", AsyncResult<int>::success(1));
    auto nested = DataProviders::transformNested<int, std::string>("nested", base, describe);

    EXPECT_EQ(nested->getCurrent(), AsyncResult<std::string>::success("value=1"));

    base->setSuccess(2);
    EXPECT_EQ(nested->getCurrent(), AsyncResult<std::string>::success("value=2"));
}

TEST_F(DataProvidersTest, TransformNestedPassesPendingAndFailureThrough) {
    auto base = ResultCell<int>::create("base");
    auto nested = DataProviders::transformNested<int, std::string>("nested", base, describe);
    EXPECT_TRUE(nested->getCurrent().isPending());

    base->setFailure(ErrorKind::UPSTREAM_FAILED, "source unavailable");
    auto current = nested->getCurrent();
    ASSERT_TRUE(current.isFailure());
    EXPECT_EQ(current.getError().kind, ErrorKind::UPSTREAM_FAILED);
    EXPECT_EQ(current.getError().message, "source unavailable");
}

TEST_F(DataProvidersTest, ThrowingTransformBecomesProcessingFailure) {
    auto base = ResultCell<int>::create("base", AsyncResult<int>::success(-1));
    auto nested = DataProviders::transformNested<int, std::string>("nested", base, [](const int &value) {
        if (value < 0) {
            throw std::out_of_range("negative");
        }
        return AsyncResult<std::string>::success("ok");
    });

    auto current = nested->getCurrent();
    ASSERT_TRUE(current.isFailure());
    EXPECT_EQ(current.getError().kind, ErrorKind::PROCESSING_FAILED);
    EXPECT_EQ(current.getError().message, "negative");
}

TEST_F(DataProvidersTest, RebindingKeepsSubscribersAndIgnoresOldBase) {
    auto first = ResultCell<int>::create("first", AsyncResult<int>::success(1));
    auto second = ResultCell<int>::create("second", AsyncResult<int>::success(10));
    auto nested = DataProviders::transformNested<int, std::string>("nested", first, describe);
    RecordingObserver<std::string> observer(nested);

    nested->setBaseProvider(second, describe);
    EXPECT_EQ(observer.getLast(), AsyncResult<std::string>::success("value=10"));
    EXPECT_EQ(nested->getBaseProvider(), second);
    EXPECT_EQ(first->getSubscriberCount(), 0u);

    first->setSuccess(2);
    EXPECT_EQ(observer.getLast(), AsyncResult<std::string>::success("value=10"));

    second->setSuccess(11);
    EXPECT_EQ(observer.getLast(), AsyncResult<std::string>::success("value=11"));
}

TEST_F(DataProvidersTest, DetachingPublishesPending) {
    auto base = ResultCell<int>::create("base", AsyncResult<int>::success(1));
    auto nested = DataProviders::transformNested<int, std::string>("nested", base, describe);

    nested->setBaseProvider(nullptr, nullptr);

    EXPECT_TRUE(nested->getCurrent().isPending());
    EXPECT_EQ(base->getSubscriberCount(), 0u);
}

TEST_F(DataProvidersTest, UnchangedDerivedValueIsNotRepublished) {
    auto base = ResultCell<int>::create("base", AsyncResult<int>::success(1));
    auto parity = DataProviders::transformNested<int, bool>(
        "parity", base, [](const int &value) { return AsyncResult<bool>::success(value % 2 == 0); });
    uint64_t version = parity->getVersion();

    base->setSuccess(3);
    EXPECT_EQ(parity->getVersion(), version);

    base->setSuccess(4);
    EXPECT_EQ(parity->getVersion(), version + 1);
}

TEST_F(DataProvidersTest, CombineWithWaitsForBothInputs) {
    auto names = ResultCell<std::string>::create("names");
    auto counts = ResultCell<int>::create("counts", AsyncResult<int>::success(3));
    auto combined =
        DataProviders::combineWith("combined", names, counts, [](const std::string &name, const int &count) {
            return name + ":" + std::to_string(count);
        });
    RecordingObserver<std::string> observer(combined);

    EXPECT_TRUE(combined->getCurrent().isPending());

    names->setSuccess("q");
    EXPECT_EQ(observer.getLast(), AsyncResult<std::string>::success("q:3"));

    counts->setSuccess(4);
    EXPECT_EQ(observer.getLast(), AsyncResult<std::string>::success("q:4"));
}

TEST_F(DataProvidersTest, CombineFailurePrecedence) {
    auto first = ResultCell<int>::create("first");
    auto second = ResultCell<int>::create("second", AsyncResult<int>::failure(ErrorKind::NOT_IMPLEMENTED, "second"));
    auto combined = DataProviders::combineWith("combined", first, second,
                                               [](const int &a, const int &b) { return a + b; });

    // Failure beats Pending
    ASSERT_TRUE(combined->getCurrent().isFailure());
    EXPECT_EQ(combined->getCurrent().getError().message, "second");

    // First input's failure wins over the second's
    first->setFailure(ErrorKind::SESSION_NOT_INITIALIZED, "first");
    EXPECT_EQ(combined->getCurrent().getError().message, "first");

    first->setSuccess(1);
    second->setSuccess(2);
    EXPECT_EQ(combined->getCurrent(), AsyncResult<int>::success(3));
}

TEST_F(DataProvidersTest, ThrowingCombinerBecomesProcessingFailure) {
    auto first = ResultCell<int>::create("first", AsyncResult<int>::success(1));
    auto second = ResultCell<int>::create("second", AsyncResult<int>::success(0));
    auto combined = DataProviders::combineWith("combined", first, second, [](const int &a, const int &b) {
        if (b == 0) {
            throw std::domain_error("division by zero");
        }
        return a / b;
    });

    auto current = combined->getCurrent();
    ASSERT_TRUE(current.isFailure());
    EXPECT_EQ(current.getError().kind, ErrorKind::PROCESSING_FAILED);
}

TEST_F(DataProvidersTest, CombinedProviderRejectsMissingInput) {
    using IntSum = CombinedProvider<int, int, int>;
    auto first = ResultCell<int>::create("first");
    auto add = [](const int &a, const int &b) { return a + b; };
    EXPECT_THROW(IntSum::create("combined", first, nullptr, add), std::invalid_argument);
}

TEST_F(DataProvidersTest, CombinedFollowsRebindableInput) {
    auto cellA = ResultCell<int>::create("a", AsyncResult<int>::success(1));
    auto cellB = ResultCell<int>::create("b", AsyncResult<int>::success(100));
    auto selector = DataProviders::transformNested<int, int>(
        "selector", cellA, [](const int &value) { return AsyncResult<int>::success(value); });
    auto offset = DataProviders::createInMemoryProvider("offset", 5);
    auto combined = DataProviders::combineWith("combined", selector, offset,
                                               [](const int &value, const int &add) { return value + add; });

    EXPECT_EQ(combined->getCurrent(), AsyncResult<int>::success(6));

    selector->setBaseProvider(cellB, [](const int &value) { return AsyncResult<int>::success(value); });
    EXPECT_EQ(combined->getCurrent(), AsyncResult<int>::success(105));
}

}  // namespace SPC
