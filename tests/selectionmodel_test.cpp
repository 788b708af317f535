#include <gtest/gtest.h>
#include "artifactstore.h"
#include "selectionmodel.h"
#include "testutils.h"

class SelectionModelTest : public ::testing::Test
{
protected:
    SelectionModelTest() : store(handles), selection(store)
    {
        for (int i = 0; i < 3; ++i) {
            store.put(i, "x", 1, 1);
        }
    }

    testutils::CountingHandleProvider handles;
    ArtifactStore store;
    SelectionModel selection;
};

TEST_F(SelectionModelTest, StartsEmpty)
{
    EXPECT_TRUE(selection.isEmpty());
    EXPECT_EQ(selection.count(), 0);
}

TEST_F(SelectionModelTest, ToggleFlips)
{
    EXPECT_TRUE(selection.toggle(1));
    EXPECT_TRUE(selection.contains(1));
    EXPECT_FALSE(selection.toggle(1));
    EXPECT_FALSE(selection.contains(1));
}

TEST_F(SelectionModelTest, UnknownIndicesAreIgnored)
{
    EXPECT_FALSE(selection.toggle(7));
    EXPECT_FALSE(selection.select(-1));
    EXPECT_FALSE(selection.contains(7));
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(SelectionModelTest, SelectAllAndDeselectAll)
{
    selection.selectAll();
    EXPECT_EQ(selection.selectedIndices(), QList<int>({0, 1, 2}));

    EXPECT_FALSE(selection.toggle(1));
    EXPECT_EQ(selection.selectedIndices(), QList<int>({0, 2}));

    selection.deselectAll();
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(SelectionModelTest, SelectedIndicesAreSorted)
{
    selection.select(2);
    selection.select(0);
    EXPECT_EQ(selection.selectedIndices(), QList<int>({0, 2}));
}

TEST_F(SelectionModelTest, ReleasedIndicesCannotBeSelected)
{
    store.releaseAll();

    selection.selectAll();
    EXPECT_TRUE(selection.isEmpty());
    EXPECT_FALSE(selection.toggle(0));
    EXPECT_FALSE(selection.select(1));
}
