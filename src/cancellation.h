#pragma once

#include <QObject>
#include <QPointer>

namespace tvremote {

// Cooperative cancellation flag. Long running operations poll isCancelled()
// between steps and abort in-flight requests on cancelled().
class CancellationToken : public QObject
{
    Q_OBJECT
public:
    explicit CancellationToken(QObject *parent = nullptr);

    bool isCancelled() const { return m_cancelled; }

    // Token that is cancelled together with this one but can also be
    // cancelled on its own. The child is owned by the caller.
    CancellationToken *createChild(QObject *parent = nullptr) const;

public slots:
    void cancel();

signals:
    void cancelled();

private:
    bool m_cancelled = false;
};

inline bool isCancelled(const CancellationToken *token)
{
    return token && token->isCancelled();
}

} // namespace tvremote
