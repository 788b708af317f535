#ifndef DISPLAYHANDLE_H
#define DISPLAYHANDLE_H

#include <QByteArray>
#include <QHash>
#include <QImage>

/**
 * Opaque reference to a presentable copy of a slice payload
 *
 * Handles are created and released through a DisplayHandleProvider. The
 * ArtifactStore is the single owner of every handle it creates.
 */
struct DisplayHandle {
    quint64 id;

    DisplayHandle() : id(0) {}
    explicit DisplayHandle(quint64 handleId) : id(handleId) {}

    bool isValid() const { return id != 0; }
    bool operator==(const DisplayHandle& other) const { return id == other.id; }
    bool operator!=(const DisplayHandle& other) const { return id != other.id; }
};

/**
 * Platform binding for display handles
 */
class DisplayHandleProvider
{
public:
    virtual ~DisplayHandleProvider() = default;

    /**
     * Create a handle for an encoded payload
     * @param payload Encoded slice bytes
     * @return New valid handle
     */
    virtual DisplayHandle create(const QByteArray& payload) = 0;

    /**
     * Release a handle; the handle must not be used afterwards
     * @param handle Handle returned by create()
     */
    virtual void release(const DisplayHandle& handle) = 0;

    /**
     * @return Number of created and not yet released handles
     */
    virtual int liveCount() const = 0;
};

/**
 * Provider that keeps a decoded QImage preview per live handle
 */
class PreviewHandleProvider : public DisplayHandleProvider
{
public:
    PreviewHandleProvider();
    ~PreviewHandleProvider() override;

    DisplayHandle create(const QByteArray& payload) override;
    void release(const DisplayHandle& handle) override;
    int liveCount() const override { return m_previews.size(); }

    /**
     * Get the preview for a live handle
     * @param handle Live handle
     * @return Decoded image, null if the handle is unknown or the payload was unreadable
     */
    QImage preview(const DisplayHandle& handle) const;

private:
    QHash<quint64, QImage> m_previews;
    quint64 m_nextId;
};

#endif // DISPLAYHANDLE_H
