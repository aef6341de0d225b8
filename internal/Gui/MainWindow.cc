#include "MainWindow.hh"

#include <QApplication>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPalette>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>

#include <CharCodec.hh>
#include <LetterCaseSteganographer.hh>
#include <MarkdownSteganographer.hh>
#include <TagSteganographer.hh>

namespace Bacon
{
    MainWindow::MainWindow(QWidget *parent) : QMainWindow(parent)
    {
        setWindowTitle("BaconStego – Bacon's cipher");
        resize(1000, 700);
        setupUi();
        statusBar()->showMessage("Ready");

        // Dark theme like VS Code
        qApp->setStyle("Fusion");
        QPalette darkPalette;
        darkPalette.setColor(QPalette::Window,          QColor(30, 30, 30));
        darkPalette.setColor(QPalette::WindowText,      Qt::white);
        darkPalette.setColor(QPalette::Base,            QColor(25, 25, 25));
        darkPalette.setColor(QPalette::AlternateBase,   QColor(35, 35, 35));
        darkPalette.setColor(QPalette::Text,            Qt::white);
        darkPalette.setColor(QPalette::Button,          QColor(45, 45, 45));
        darkPalette.setColor(QPalette::ButtonText,      Qt::white);
        darkPalette.setColor(QPalette::BrightText,      Qt::red);
        darkPalette.setColor(QPalette::Highlight,       QColor(42, 130, 218));
        qApp->setPalette(darkPalette);

        setStyleSheet(R"(
            QLabel { color: #d4d4d4; }
            QPushButton { background-color: #007acc; border: none; padding: 8px; border-radius: 4px; }
            QPushButton:hover { background-color: #148cd2; }
            QLineEdit, QPlainTextEdit { background-color: #3c3c3c; border: 1px solid #555; padding: 6px; }
        )");
    }

    void MainWindow::setupUi()
    {
        auto *central = new QWidget(this);
        setCentralWidget(central);
        auto *mainLayout = new QVBoxLayout(central);

        // ── Settings ───────────────────────────────────────────
        auto *settingsBox = new QGroupBox("Carrier");
        auto *settingsLayout = new QFormLayout(settingsBox);

        carrierCombo = new QComboBox;
        carrierCombo->addItem("Letter case", LetterCase);
        carrierCombo->addItem("Markdown markers", Markdown);
        carrierCombo->addItem("Tags", Tags);
        connect(carrierCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::carrierChanged);

        variantCombo = new QComboBox;
        variantCombo->addItem("V1 (24 letters, I=J, U=V)", static_cast<int>(CodecVariant::V1));
        variantCombo->addItem("V2 (26 letters)", static_cast<int>(CodecVariant::V2));

        aStartEdit = new QLineEdit;
        aEndEdit = new QLineEdit;
        bStartEdit = new QLineEdit;
        bEndEdit = new QLineEdit;
        auto *aLayout = new QHBoxLayout;
        aLayout->addWidget(aStartEdit);
        aLayout->addWidget(aEndEdit);
        auto *bLayout = new QHBoxLayout;
        bLayout->addWidget(bStartEdit);
        bLayout->addWidget(bEndEdit);

        optimizeCheck = new QCheckBox("Merge adjacent tags");
        optimizeCheck->setChecked(true);

        settingsLayout->addRow("Carrier:", carrierCombo);
        settingsLayout->addRow("Alphabet:", variantCombo);
        settingsLayout->addRow("A start / end:", aLayout);
        settingsLayout->addRow("B start / end:", bLayout);
        settingsLayout->addRow("", optimizeCheck);
        mainLayout->addWidget(settingsBox);

        // ── Texts ──────────────────────────────────────────────
        secretEdit = new QPlainTextEdit;
        secretEdit->setPlaceholderText("Secret (letters and spaces)");
        secretEdit->setMaximumHeight(80);
        publicEdit = new QPlainTextEdit;
        publicEdit->setPlaceholderText("Public text, or disguised text to reveal");
        outputEdit = new QPlainTextEdit;
        outputEdit->setReadOnly(true);

        auto *splitter = new QSplitter(Qt::Vertical);
        splitter->addWidget(secretEdit);
        splitter->addWidget(publicEdit);
        splitter->addWidget(outputEdit);
        mainLayout->addWidget(splitter, 1);

        // ── Actions ────────────────────────────────────────────
        auto *actionsLayout = new QHBoxLayout;
        auto *disguiseBtn = new QPushButton("Disguise");
        connect(disguiseBtn, &QPushButton::clicked, this, &MainWindow::disguiseText);
        auto *revealBtn = new QPushButton("Reveal");
        connect(revealBtn, &QPushButton::clicked, this, &MainWindow::revealText);
        auto *swapBtn = new QPushButton("Output → public text");
        connect(swapBtn, &QPushButton::clicked, this, &MainWindow::swapOutputToInput);
        actionsLayout->addWidget(disguiseBtn);
        actionsLayout->addWidget(revealBtn);
        actionsLayout->addWidget(swapBtn);
        mainLayout->addLayout(actionsLayout);

        carrierChanged(carrierCombo->currentIndex());
    }

    void MainWindow::carrierChanged(int index)
    {
        const int kind = carrierCombo->itemData(index).toInt();
        const bool delimited = kind != LetterCase;
        aStartEdit->setEnabled(delimited);
        aEndEdit->setEnabled(delimited);
        bStartEdit->setEnabled(delimited);
        bEndEdit->setEnabled(delimited);
        optimizeCheck->setEnabled(kind == Tags);

        if (kind == Markdown) {
            aStartEdit->clear();
            aEndEdit->clear();
            bStartEdit->setText("*");
            bEndEdit->setText("*");
        } else if (kind == Tags) {
            aStartEdit->setText("<i>");
            aEndEdit->setText("</i>");
            bStartEdit->setText("<b>");
            bEndEdit->setText("</b>");
        }
    }

    Marker MainWindow::markerFrom(const QLineEdit* start, const QLineEdit* end) const
    {
        std::optional<std::string> s;
        std::optional<std::string> e;
        if (!start->text().isEmpty())
            s = start->text().toStdString();
        if (!end->text().isEmpty())
            e = end->text().toStdString();
        return Marker(s, e);
    }

    Result<std::shared_ptr<Steganographer>> MainWindow::buildCarrier() const
    {
        const int kind = carrierCombo->currentData().toInt();
        if (kind == LetterCase)
            return std::shared_ptr<Steganographer>(std::make_shared<LetterCaseSteganographer>());

        const Marker a = markerFrom(aStartEdit, aEndEdit);
        const Marker b = markerFrom(bStartEdit, bEndEdit);

        if (kind == Markdown) {
            Result<MarkdownSteganographer> markdown = MarkdownSteganographer::create(a, b);
            if (!markdown)
                return markdown.error();
            return std::shared_ptr<Steganographer>(std::make_shared<MarkdownSteganographer>(markdown.value()));
        }

        Result<TagSteganographer> tags = TagSteganographer::create(a, b);
        if (!tags)
            return tags.error();
        tags->set_optimize_disguise(optimizeCheck->isChecked());
        return std::shared_ptr<Steganographer>(std::make_shared<TagSteganographer>(tags.value()));
    }

    void MainWindow::disguiseText()
    {
        Result<std::shared_ptr<Steganographer>> carrier = buildCarrier();
        if (!carrier) {
            showError(carrier.error());
            return;
        }

        const auto variant = static_cast<CodecVariant>(variantCombo->currentData().toInt());
        const TableCodec<char> codec('A', 'B', variant);
        Result<std::string> output = (*carrier)->disguise(secretEdit->toPlainText().toStdString(),
                                                          publicEdit->toPlainText().toStdString(), codec);
        if (!output) {
            showError(output.error());
            return;
        }
        outputEdit->setPlainText(QString::fromStdString(output.value()));
        statusBar()->showMessage(QString("Disguised with %1").arg(QString::fromStdString((*carrier)->name())));
    }

    void MainWindow::revealText()
    {
        Result<std::shared_ptr<Steganographer>> carrier = buildCarrier();
        if (!carrier) {
            showError(carrier.error());
            return;
        }

        const auto variant = static_cast<CodecVariant>(variantCombo->currentData().toInt());
        const TableCodec<char> codec('A', 'B', variant);
        Result<std::string> output = (*carrier)->reveal(publicEdit->toPlainText().toStdString(), codec);
        if (!output) {
            showError(output.error());
            return;
        }
        outputEdit->setPlainText(QString::fromStdString(output.value()));
        statusBar()->showMessage("Revealed (best effort: trailing groups may be noise)");
    }

    void MainWindow::swapOutputToInput()
    {
        publicEdit->setPlainText(outputEdit->toPlainText());
        outputEdit->clear();
    }

    void MainWindow::showError(const BaconError& error)
    {
        QMessageBox::critical(this, QString::fromStdString(error.describe()),
                              QString::fromStdString(error.message()));
        statusBar()->showMessage("Error");
    }
} // Bacon
