#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QSlider>
#include <QComboBox>
#include <QColorDialog>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <future>
#include <iostream>
#include <mutex>
#include <queue>
#include <memory>
#include <vector>

#include "devices/device_builder.hpp"
#include "transport/bluez.hpp"
#include "common/effects.hpp"

using namespace bledom;

class LightGui : public QWidget
{
    Q_OBJECT

public:
    LightGui()
    {
        setWindowTitle("ELK-BLEDOM Control");
        resize(460, 560);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not connected");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        btn_connect_ = new QPushButton("Connect");
        connect(btn_connect_, &QPushButton::clicked, this, &LightGui::connectDevice);
        layout->addWidget(btn_connect_);

        auto* power_layout = new QHBoxLayout();
        auto* btn_on = new QPushButton("ON");
        connect(btn_on, &QPushButton::clicked, this, [this]() { command("POWER", device_->power_on()); });
        power_layout->addWidget(btn_on);
        auto* btn_off = new QPushButton("OFF");
        connect(btn_off, &QPushButton::clicked, this, [this]() { command("POWER", device_->power_off()); });
        power_layout->addWidget(btn_off);
        layout->addLayout(power_layout);

        layout->addWidget(new QLabel("Brightness:"));
        brightness_ = new QSlider(Qt::Horizontal);
        brightness_->setRange(0, Protocol::Limits::MAX_BRIGHTNESS);
        brightness_->setValue(Protocol::Limits::MAX_BRIGHTNESS);
        connect(brightness_, &QSlider::sliderReleased, this, [this]() {
            command("BRIGHTNESS", device_->set_brightness(static_cast<uint8_t>(brightness_->value())));
        });
        layout->addWidget(brightness_);

        auto* color_layout = new QHBoxLayout();
        addColorButton(color_layout, "Red", 255, 0, 0);
        addColorButton(color_layout, "Green", 0, 255, 0);
        addColorButton(color_layout, "Blue", 0, 0, 255);
        addColorButton(color_layout, "White", 255, 255, 255);
        auto* btn_pick = new QPushButton("Pick...");
        connect(btn_pick, &QPushButton::clicked, this, &LightGui::pickColor);
        color_layout->addWidget(btn_pick);
        layout->addLayout(color_layout);

        auto* effect_layout = new QHBoxLayout();
        effects_ = new QComboBox();
        for (const auto& entry : EFFECT_TABLE) {
            effects_->addItem(entry.name, static_cast<int>(entry.effect));
        }
        effect_layout->addWidget(effects_);
        auto* btn_effect = new QPushButton("Run Effect");
        connect(btn_effect, &QPushButton::clicked, this, [this]() {
            command("EFFECT", device_->set_effect(static_cast<uint8_t>(effects_->currentData().toInt())));
        });
        effect_layout->addWidget(btn_effect);
        layout->addLayout(effect_layout);

        layout->addWidget(new QLabel("Effect speed:"));
        speed_ = new QSlider(Qt::Horizontal);
        speed_->setRange(0, Protocol::Limits::MAX_EFFECT_SPEED);
        speed_->setValue(50);
        connect(speed_, &QSlider::sliderReleased, this, [this]() {
            command("SPEED", device_->set_effect_speed(static_cast<uint8_t>(speed_->value())));
        });
        layout->addWidget(speed_);

        auto* btn_sync = new QPushButton("Sync Time");
        connect(btn_sync, &QPushButton::clicked, this, [this]() { command("TIME", device_->sync_time()); });
        layout->addWidget(btn_sync);

        controls_ = {btn_on, btn_off, brightness_, btn_pick, effects_, btn_effect, speed_, btn_sync};
        for (auto* child : color_buttons_) {
            controls_.push_back(child);
        }
        setControlsEnabled(false);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear = new QPushButton("Clear Log");
        connect(btn_clear, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear);

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &LightGui::processMessages);
        message_timer_->start(50);

        builder_ = std::make_unique<DeviceBuilder>(manager_);
        builder_->set_log_callback([this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString::fromStdString(msg));
        });

        logMsg("[INIT] Press Connect to scan for a light");
    }

    ~LightGui()
    {
        if (pending_.valid()) {
            pending_.wait();
        }
        if (device_) {
            auto closed = device_->peripheral().disconnect();
            if (!closed.ok()) {
                std::cerr << "disconnect: " << closed.describe() << std::endl;
            }
        }
    }

private slots:
    void processMessages()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            while (!log_queue_.empty()) {
                logMsg(log_queue_.front());
                log_queue_.pop();
            }
        }

        if (pending_.valid()
            && pending_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            auto result = pending_.get();
            btn_connect_->setEnabled(true);
            if (result.ok()) {
                device_ = std::make_unique<BledomDevice>(std::move(result.value()));
                device_->set_log_callback([this](const std::string& msg) { logMsg(QString::fromStdString(msg)); });
                status_label_->setText(QString("Status: Connected to %1")
                    .arg(QString::fromStdString(device_->peripheral().id())));
                btn_connect_->setText("Reconnect");
                setControlsEnabled(true);
            } else {
                status_label_->setText("Status: Connect failed");
                logMsg("[BUILD] " + QString::fromStdString(result.describe()));
            }
        }
    }

    void connectDevice()
    {
        if (pending_.valid()) {
            logMsg("[BUILD] Already connecting");
            return;
        }

        if (device_) {
            auto closed = device_->peripheral().disconnect();
            if (!closed.ok()) {
                logMsg("[BUILD] Disconnect failed: " + QString::fromStdString(closed.describe()));
            }
            device_.reset();
        }

        setControlsEnabled(false);
        btn_connect_->setEnabled(false);
        status_label_->setText("Status: Scanning...");
        pending_ = builder_->build_async();
    }

    void pickColor()
    {
        QColor color = QColorDialog::getColor(Qt::white, this, "Light color");
        if (!color.isValid()) return;
        command("COLOR", device_->set_color(static_cast<uint8_t>(color.red()),
                                            static_cast<uint8_t>(color.green()),
                                            static_cast<uint8_t>(color.blue())));
    }

private:
    void addColorButton(QHBoxLayout* layout, const char* label, uint8_t r, uint8_t g, uint8_t b)
    {
        auto* btn = new QPushButton(label);
        connect(btn, &QPushButton::clicked, this, [this, r, g, b]() {
            command("COLOR", device_->set_color(r, g, b));
        });
        layout->addWidget(btn);
        color_buttons_.push_back(btn);
    }

    void command(const char* tag, const Result<bool>& result)
    {
        if (result.ok()) {
            status_label_->setText(QString("%1 sent").arg(tag));
        } else {
            status_label_->setText(QString("%1 failed").arg(tag));
            logMsg(QString("[%1] FAILED: %2").arg(tag, QString::fromStdString(result.describe())));
        }
    }

    void setControlsEnabled(bool enabled)
    {
        for (auto* w : controls_) {
            w->setEnabled(enabled);
        }
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    bluez::HciManager manager_;
    std::unique_ptr<DeviceBuilder> builder_;
    std::unique_ptr<BledomDevice> device_;
    std::future<Result<BledomDevice>> pending_;

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    QTimer* message_timer_;

    QLabel* status_label_;
    QPushButton* btn_connect_;
    QSlider* brightness_;
    QSlider* speed_;
    QComboBox* effects_;
    QTextEdit* log_text_;
    std::vector<QPushButton*> color_buttons_;
    std::vector<QWidget*> controls_;
};

#include "qt_gui.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    LightGui gui;
    gui.show();
    return app.exec();
}
