#ifndef SELECTIONMODEL_H
#define SELECTIONMODEL_H

#include <QList>
#include <set>

class ArtifactStore;

/**
 * Set of selected slice indices
 *
 * Only indices present in the ArtifactStore can be selected; requests for
 * anything else are ignored.
 */
class SelectionModel
{
public:
    explicit SelectionModel(const ArtifactStore& store);

    /**
     * Flip the selection state of an index
     * @param index Slice index
     * @return true if the index is selected afterwards
     */
    bool toggle(int index);

    /**
     * Select an index
     * @param index Slice index
     * @return false if the index is not in the store
     */
    bool select(int index);

    /**
     * Select every index currently in the store
     */
    void selectAll();

    void deselectAll();

    bool contains(int index) const;

    /**
     * @return Selected indices in ascending order
     */
    QList<int> selectedIndices() const;

    int count() const { return static_cast<int>(m_selected.size()); }
    bool isEmpty() const { return m_selected.empty(); }

private:
    const ArtifactStore& m_store;
    std::set<int> m_selected;
};

#endif // SELECTIONMODEL_H
