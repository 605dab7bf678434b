// Widget-level checks for the prompt and credential picker front ends.
// Run with QT_QPA_PLATFORM=offscreen.
#include "CredentialPickerDialog.hpp"
#include "UiPrompter.hpp"

#include <QAbstractButton>
#include <QApplication>
#include <QMessageBox>
#include <QPushButton>
#include <QTimer>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// Polls until a modal widget is up and hands it to the action.
void whenModal(std::function<void(QWidget *)> action) {
    auto *timer = new QTimer(qApp);
    timer->setInterval(10);
    QObject::connect(timer, &QTimer::timeout, [timer, action]() {
        QWidget *w = QApplication::activeModalWidget();
        if (!w)
            return;
        timer->stop();
        timer->deleteLater();
        action(w);
    });
    timer->start();
}

QPushButton *buttonLabeled(QWidget *w, const QString &label) {
    for (QPushButton *b : w->findChildren<QPushButton *>()) {
        if (b->text() == label)
            return b;
    }
    return nullptr;
}

std::vector<rdpvisor::PickerItem> sampleItems() {
    return {{"cred-1", "Admin", "CORP\\admin", "RDP"},
            {"cred-2", "Operator", "CORP\\ops", "RDP"}};
}

void test_picker_dialog_selection(TestContext &t) {
    CredentialPickerDialog dlg(sampleItems());
    const std::string first = dlg.selectedEntryId();
    t.check(first == "cred-1" || first == "cred-2", "a row is preselected");
    t.check(!dlg.noneRequested(), "none not requested initially");

    CredentialPickerDialog empty({});
    t.check(empty.selectedEntryId().empty(), "no selection without items");
}

void test_picker_none_button(TestContext &t) {
    UiCredentialPicker picker;
    whenModal([](QWidget *w) {
        if (QPushButton *b = buttonLabeled(w, QStringLiteral("Without credentials")))
            b->click();
        else
            static_cast<QDialog *>(w)->reject();
    });
    const rdpvisor::PickResult r = picker.pick(sampleItems());
    t.check(r.status == rdpvisor::PickResult::Status::None, "none button");
    t.check(r.entryId.empty(), "no entry for none");
}

void test_picker_accept_and_cancel(TestContext &t) {
    UiCredentialPicker picker;
    whenModal([](QWidget *w) { static_cast<QDialog *>(w)->accept(); });
    rdpvisor::PickResult r = picker.pick(sampleItems());
    t.check(r.status == rdpvisor::PickResult::Status::Chosen, "accepted with a row");
    t.check(r.entryId == "cred-1" || r.entryId == "cred-2", "chosen entry id");

    whenModal([](QWidget *w) { static_cast<QDialog *>(w)->reject(); });
    r = picker.pick(sampleItems());
    t.check(r.status == rdpvisor::PickResult::Status::Cancelled, "rejected");
}

void test_prompter_returns_button_index(TestContext &t) {
    UiPrompter prompter;
    rdpvisor::PromptRequest req;
    req.title = "Duplicate connection";
    req.message = "A session for srv-a is already running.";
    req.icon = rdpvisor::PromptIcon::Question;
    req.buttons = {"Yes", "No"};
    req.defaultIndex = 1;

    whenModal([](QWidget *w) {
        if (QPushButton *b = buttonLabeled(w, QStringLiteral("Yes")))
            b->click();
        else
            w->close();
    });
    t.check(prompter.prompt(req) == 0, "first button index");

    whenModal([](QWidget *w) {
        if (QPushButton *b = buttonLabeled(w, QStringLiteral("No")))
            b->click();
        else
            w->close();
    });
    t.check(prompter.prompt(req) == 1, "second button index");

    rdpvisor::PromptRequest info;
    info.title = "Notice";
    info.message = "Nothing to connect to.";
    whenModal([](QWidget *w) {
        if (auto *box = qobject_cast<QMessageBox *>(w)) {
            if (!box->buttons().isEmpty())
                box->buttons().first()->click();
        }
    });
    t.check(prompter.prompt(info) == 0, "single OK button");
}

} // namespace

int main(int argc, char **argv) {
    QApplication app(argc, argv);
    TestContext t;
    test_picker_dialog_selection(t);
    test_picker_none_button(t);
    test_picker_accept_and_cancel(t);
    test_prompter_returns_button_index(t);

    if (t.failures > 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] ui_tests\n";
    return EXIT_SUCCESS;
}
