#ifndef BACONSTEGO_MAINWINDOW_HH
#define BACONSTEGO_MAINWINDOW_HH

#include <QMainWindow>
#include <QCheckBox>
#include <QComboBox>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <memory>

#include <BaconError.hh>
#include <Steganographer.hh>
#include <Marker.hh>

namespace Bacon
{
    class MainWindow : public QMainWindow
    {
        Q_OBJECT
    public:
        explicit MainWindow(QWidget *parent = nullptr);
        ~MainWindow() override = default;

    private slots:
        void disguiseText();
        void revealText();
        void carrierChanged(int index);
        void swapOutputToInput();

    private:
        enum CarrierKind { LetterCase = 0, Markdown = 1, Tags = 2 };

        void setupUi();

        /**
         * Build the steganographer selected in the UI
         * @return carrier or the configuration error
         */
        Result<std::shared_ptr<Steganographer>> buildCarrier() const;

        Marker markerFrom(const QLineEdit* start, const QLineEdit* end) const;

        void showError(const BaconError& error);

        QPlainTextEdit *secretEdit = nullptr;
        QPlainTextEdit *publicEdit = nullptr;
        QPlainTextEdit *outputEdit = nullptr;

        QComboBox *carrierCombo = nullptr;
        QComboBox *variantCombo = nullptr;

        QLineEdit *aStartEdit = nullptr;
        QLineEdit *aEndEdit   = nullptr;
        QLineEdit *bStartEdit = nullptr;
        QLineEdit *bEndEdit   = nullptr;
        QCheckBox *optimizeCheck = nullptr;
    };
} // Bacon

#endif //BACONSTEGO_MAINWINDOW_HH
