module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

module devsrv.core.activitylog;

ActivityLog::ActivityLog(int maxLines)
    : m_maxLines(qMax(1, maxLines))
{
}

void ActivityLog::append(const QString& message)
{
    if (!m_enabled) {
        return;
    }

    const QString line = message.trimmed();
    if (line.isEmpty()) {
        return;
    }

    const bool duplicate = !m_lines.isEmpty() && m_lines.last() == line;
    if (duplicate) {
        return;
    }

    m_lines.append(line);
    while (m_lines.size() > m_maxLines) {
        m_lines.removeFirst();
    }
}

void ActivityLog::setEnabled(bool enabled)
{
    m_enabled = enabled;
}

bool ActivityLog::isEnabled() const
{
    return m_enabled;
}

QStringList ActivityLog::recent() const
{
    return m_lines;
}

QString ActivityLog::latest() const
{
    return m_lines.isEmpty() ? QString() : m_lines.last();
}

void ActivityLog::clear()
{
    m_lines.clear();
}
