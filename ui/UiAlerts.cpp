#include "UiAlerts.hpp"

#include <QAbstractButton>
#include <QList>
#include <QPushButton>

namespace UiAlerts {
namespace {
QMessageBox::ButtonRole roleFor(int index, int count) {
    if (count <= 1)
        return QMessageBox::AcceptRole;
    // Last button of several behaves as the escape/cancel choice.
    return index == count - 1 ? QMessageBox::RejectRole
                              : QMessageBox::AcceptRole;
}
} // namespace

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

int choose(QWidget *parent, QMessageBox::Icon icon, const QString &title,
           const QString &text, const QString &informative,
           const QStringList &buttons, int defaultIndex) {
    QMessageBox box(parent);
    configure(box);
    box.setIcon(icon);
    box.setWindowTitle(title);
    box.setText(text);
    if (!informative.isEmpty())
        box.setInformativeText(informative);

    const QStringList labels =
        buttons.isEmpty() ? QStringList{QObject::tr("OK")} : buttons;
    QList<QPushButton *> added;
    for (int i = 0; i < labels.size(); ++i)
        added << box.addButton(labels.at(i), roleFor(i, labels.size()));
    if (defaultIndex >= 0 && defaultIndex < added.size())
        box.setDefaultButton(added.at(defaultIndex));
    if (labels.size() > 1)
        box.setEscapeButton(added.constLast());

    box.exec();
    QAbstractButton *clicked = box.clickedButton();
    for (int i = 0; i < added.size(); ++i) {
        if (added.at(i) == clicked)
            return i;
    }
    return -1;
}

} // namespace UiAlerts
