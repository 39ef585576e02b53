#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <functional>

#include "devices/cavro_pump.hpp"
#include "common/helpers.hpp"

using namespace cavro;

class PumpGui : public QWidget
{
    Q_OBJECT

public:
    PumpGui()
    {
        setWindowTitle("Cavro Pump");
        resize(500, 600);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not connected");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        valve_label_ = new QLabel("Valve: -");
        layout->addWidget(valve_label_);

        auto* port_layout = new QHBoxLayout();
        port_edit_ = new QLineEdit();
        port_edit_->setPlaceholderText("Port (empty = scan)");
        port_layout->addWidget(port_edit_);
        auto* btn_connect = new QPushButton("Connect");
        connect(btn_connect, &QPushButton::clicked, this, &PumpGui::connectPump);
        port_layout->addWidget(btn_connect);
        auto* btn_disconnect = new QPushButton("Disconnect");
        connect(btn_disconnect, &QPushButton::clicked, this, &PumpGui::disconnectPump);
        port_layout->addWidget(btn_disconnect);
        layout->addLayout(port_layout);

        auto* btn_init = new QPushButton("Initialize");
        connect(btn_init, &QPushButton::clicked, this, &PumpGui::initializePump);
        layout->addWidget(btn_init);

        auto* valve_layout = new QHBoxLayout();
        for (int i = 1; i <= 3; ++i) {
            auto* btn = new QPushButton(QString("Valve %1").arg(i));
            connect(btn, &QPushButton::clicked, this, [this, i]() {
                selectValve(static_cast<ValvePosition>(i));
            });
            valve_layout->addWidget(btn);
        }
        auto* btn_query = new QPushButton("Query");
        connect(btn_query, &QPushButton::clicked, this, &PumpGui::queryValve);
        valve_layout->addWidget(btn_query);
        layout->addLayout(valve_layout);

        auto* speed_layout = new QHBoxLayout();
        speed_spin_ = new QSpinBox();
        speed_spin_->setRange(0, 40);
        speed_spin_->setValue(20);
        speed_layout->addWidget(new QLabel("Speed:"));
        speed_layout->addWidget(speed_spin_);
        auto* btn_speed = new QPushButton("Set");
        connect(btn_speed, &QPushButton::clicked, this, &PumpGui::setSpeed);
        speed_layout->addWidget(btn_speed);
        layout->addLayout(speed_layout);

        auto* pos_layout = new QHBoxLayout();
        pos_spin_ = new QSpinBox();
        pos_spin_->setRange(0, 3000);
        pos_layout->addWidget(new QLabel("Plunger:"));
        pos_layout->addWidget(pos_spin_);
        auto* btn_move = new QPushButton("Move");
        connect(btn_move, &QPushButton::clicked, this, &PumpGui::movePlunger);
        pos_layout->addWidget(btn_move);
        layout->addLayout(pos_layout);

        auto* btn_cancel = new QPushButton("Cancel wait");
        connect(btn_cancel, &QPushButton::clicked, this, [this]() {
            if (busy_.load()) {
                pump_.cancel();
                logMsg("[GUI] Cancel requested");
            }
        });
        layout->addWidget(btn_cancel);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear = new QPushButton("Clear Log");
        connect(btn_clear, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear);

        pump_.set_log_callback([this](const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString::fromStdString(msg));
        });

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &PumpGui::processMessages);
        message_timer_->start(50);
    }

    ~PumpGui()
    {
        pump_.cancel();
        if (worker_.joinable()) {
            worker_.join();
        }
        pump_.set_log_callback(nullptr);
        pump_.disconnect();
    }

private slots:
    void processMessages()
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!log_queue_.empty()) {
            logMsg(log_queue_.front());
            log_queue_.pop();
        }
        while (!status_queue_.empty()) {
            status_label_->setText(status_queue_.front());
            status_queue_.pop();
        }
        while (!valve_queue_.empty()) {
            valve_label_->setText(QString("Valve: %1").arg(valve_queue_.front()));
            valve_queue_.pop();
        }
    }

    void connectPump()
    {
        std::string port = port_edit_->text().toStdString();
        run("Connect", [this, port]() {
            auto r = port.empty() ? pump_.connect() : pump_.connect_to(port);
            if (r.ok()) {
                postStatus(QString("Connected on %1").arg(QString::fromStdString(pump_.port())));
            } else {
                postStatus(QString("Connect failed: %1").arg(QString::fromStdString(to_string(r.error()))));
            }
        });
    }

    void disconnectPump()
    {
        run("Disconnect", [this]() {
            pump_.disconnect();
            postStatus("Status: Not connected");
        });
    }

    void initializePump()
    {
        run("Initialize", [this]() {
            auto r = pump_.initialize();
            if (r.ok()) {
                postStatus(QString("Initialized (%1)").arg(QString::fromStdString(to_string(r.value()))));
            } else {
                postStatus(QString("Initialize failed: %1").arg(QString::fromStdString(to_string(r.error()))));
            }
        });
    }

    void selectValve(ValvePosition pos)
    {
        run("Valve", [this, pos]() {
            report("Valve", pump_.set_valve_position(pos));
            readValve();
        });
    }

    void queryValve()
    {
        run("Query", [this]() { readValve(); });
    }

    void setSpeed()
    {
        uint16_t speed = static_cast<uint16_t>(speed_spin_->value());
        run("Speed", [this, speed]() { report("Speed", pump_.set_speed(speed)); });
    }

    void movePlunger()
    {
        uint16_t pos = static_cast<uint16_t>(pos_spin_->value());
        run("Move", [this, pos]() { report("Move", pump_.set_absolute_position(pos)); });
    }

private:
    // One pump command in flight at a time; they can block in the ready poll.
    void run(const QString& name, std::function<void()> job)
    {
        if (busy_.load()) {
            logMsg(QString("[GUI] Busy, ignoring %1").arg(name));
            return;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        busy_.store(true);
        worker_ = std::thread([this, job]() {
            job();
            pump_.clear_cancel();
            busy_.store(false);
        });
    }

    void readValve()
    {
        auto v = pump_.get_valve_position();
        std::lock_guard<std::mutex> lock(queue_mutex_);
        valve_queue_.push(v.ok() ? QString::number(static_cast<int>(v.value())) : QString("?"));
    }

    void report(const char* what, const Result<bool>& r)
    {
        QString msg;
        if (r.ok()) {
            msg = QString("%1 OK").arg(what);
        } else if (r.error() == Error::DEVICE_ERROR) {
            msg = QString("%1 failed: %2").arg(what, QString::fromStdString(to_string(r.device_status())));
        } else {
            msg = QString("%1 failed: %2").arg(what, QString::fromStdString(to_string(r.error())));
        }
        postStatus(msg);
    }

    void postStatus(const QString& msg)
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        status_queue_.push(msg);
        log_queue_.push("[GUI] " + msg);
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    CavroPump pump_;
    std::thread worker_;
    std::atomic<bool> busy_{false};

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    std::queue<QString> status_queue_;
    std::queue<QString> valve_queue_;
    QTimer* message_timer_;

    QLabel* status_label_;
    QLabel* valve_label_;
    QLineEdit* port_edit_;
    QSpinBox* speed_spin_;
    QSpinBox* pos_spin_;
    QTextEdit* log_text_;
};

#include "qt_gui.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    PumpGui gui;
    gui.show();
    return app.exec();
}
