#include <gtest/gtest.h>
#include "artifactstore.h"
#include "testutils.h"

using testutils::CountingHandleProvider;

TEST(ArtifactStoreTest, PutCreatesHandle)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);

    SliceArtifact artifact = store.put(0, "payload", 640, 1000);

    EXPECT_EQ(artifact.index, 0);
    EXPECT_EQ(artifact.width, 640);
    EXPECT_EQ(artifact.height, 1000);
    EXPECT_TRUE(artifact.displayHandle.isValid());
    EXPECT_EQ(handles.liveCount(), 1);

    std::optional<SliceArtifact> stored = store.get(0);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->payload, QByteArray("payload"));
    EXPECT_EQ(stored->displayHandle, artifact.displayHandle);
}

TEST(ArtifactStoreTest, GetMissingIndex)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);

    EXPECT_FALSE(store.get(3).has_value());
    EXPECT_FALSE(store.contains(3));
}

TEST(ArtifactStoreTest, AllIsOrderedByIndex)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);
    store.put(2, "c", 1, 1);
    store.put(0, "a", 1, 1);
    store.put(1, "b", 1, 1);

    QList<SliceArtifact> artifacts = store.all();
    ASSERT_EQ(artifacts.size(), 3);
    EXPECT_EQ(artifacts[0].payload, QByteArray("a"));
    EXPECT_EQ(artifacts[1].payload, QByteArray("b"));
    EXPECT_EQ(artifacts[2].payload, QByteArray("c"));
    EXPECT_EQ(store.indices(), QList<int>({0, 1, 2}));
}

TEST(ArtifactStoreTest, Contiguity)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);
    EXPECT_TRUE(store.isContiguous());

    store.put(0, "a", 1, 1);
    store.put(2, "c", 1, 1);
    EXPECT_FALSE(store.isContiguous());

    store.put(1, "b", 1, 1);
    EXPECT_TRUE(store.isContiguous());
}

TEST(ArtifactStoreTest, DuplicateIndexKeepsFirstArtifact)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);

    SliceArtifact first = store.put(0, "old", 1, 1);
    SliceArtifact second = store.put(0, "new", 2, 2);

    EXPECT_EQ(second.displayHandle, first.displayHandle);
    EXPECT_EQ(second.payload, QByteArray("old"));
    EXPECT_EQ(second.width, 1);
    EXPECT_EQ(handles.created, 1);
    EXPECT_EQ(handles.released, 0);
    EXPECT_EQ(handles.liveCount(), 1);
    EXPECT_EQ(store.size(), 1);
    EXPECT_EQ(store.get(0)->payload, QByteArray("old"));

    // Handles are released only by releaseAll
    EXPECT_EQ(store.releaseAll(), 1);
    EXPECT_EQ(handles.released, 1);
    EXPECT_EQ(handles.unknownReleases, 0);
}

TEST(ArtifactStoreTest, ReleaseAllReleasesEveryHandleOnce)
{
    CountingHandleProvider handles;
    ArtifactStore store(handles);
    for (int i = 0; i < 5; ++i) {
        store.put(i, "x", 1, 1);
    }

    EXPECT_EQ(store.releaseAll(), 5);
    EXPECT_TRUE(store.isEmpty());
    EXPECT_EQ(handles.liveCount(), 0);
    EXPECT_EQ(handles.released, 5);

    // Idempotent
    EXPECT_EQ(store.releaseAll(), 0);
    EXPECT_EQ(handles.released, 5);
    EXPECT_EQ(handles.unknownReleases, 0);
}

TEST(ArtifactStoreTest, DestructorReleasesHandles)
{
    CountingHandleProvider handles;
    {
        ArtifactStore store(handles);
        store.put(0, "a", 1, 1);
        store.put(1, "b", 1, 1);
    }

    EXPECT_EQ(handles.created, 2);
    EXPECT_EQ(handles.released, 2);
    EXPECT_EQ(handles.liveCount(), 0);
}
