#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/vector3_stamped.hpp"
#include "sensor_msgs/msg/imu.hpp"
#include "sensor_msgs/msg/nav_sat_fix.hpp"
#include "sensor_msgs/msg/battery_state.hpp"
#include "std_msgs/msg/float32.hpp"
#include "std_msgs/msg/u_int16_multi_array.hpp"
#include "std_msgs/msg/string.hpp"
#include "diagnostic_msgs/msg/diagnostic_status.hpp"
#include "diagnostic_msgs/msg/key_value.hpp"
#include "wiiproxy/MSPSession.hpp"
#include "wiiproxy/PollRate.hpp"
#include "wiiproxy/SerialPort.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace wiiproxy;

constexpr double kDefaultPollHzHigh = 20.0;
constexpr double kDefaultPollHzLow = 2.0;

class MSPBridgeNode : public rclcpp::Node {
public:
  MSPBridgeNode() : Node("msp_bridge") {
    port_ = declare_parameter<std::string>("device_path", "/dev/ttyUSB0");
    baud_ = declare_parameter<int>("baud", 115200);
    timeout_s_ = declare_parameter<double>("request_timeout_s", 0.1);

    SessionConfig cfg;
    cfg.default_timeout_s = timeout_s_;
    cfg.dispatcher.desync_threshold = (size_t)declare_parameter<int>("desync_threshold", 8);
    cfg.dispatcher.stale_reply_window_s = declare_parameter<double>("stale_reply_window_s", 0.5);
    cfg.dispatcher.write_delay_s = declare_parameter<double>("write_delay_s", 0.005);

    poll_hz_high_ = declare_parameter<double>("poll_hz_high", kDefaultPollHzHigh);
    poll_hz_low_  = declare_parameter<double>("poll_hz_low",  kDefaultPollHzLow);

    enable_att_    = declare_parameter<bool>("enable_attitude", true);
    enable_imu_    = declare_parameter<bool>("enable_imu", true);
    enable_rc_     = declare_parameter<bool>("enable_rc", true);
    enable_mot_    = declare_parameter<bool>("enable_motors", true);
    enable_alt_    = declare_parameter<bool>("enable_altitude", true);
    enable_status_ = declare_parameter<bool>("enable_status", true);
    enable_analog_ = declare_parameter<bool>("enable_analog", true);
    enable_gps_    = declare_parameter<bool>("enable_gps", false);

    createPublishers();

    session_ = std::make_unique<Session>(std::make_unique<SerialPort>(port_, baud_), cfg);
    if (session_->open() != wiiproxy::Status::Ok) {
      RCLCPP_ERROR(get_logger(), "Failed to open serial port: %s", port_.c_str());
      throw std::runtime_error("Failed to open serial");
    }
    RCLCPP_INFO(get_logger(), "Connected to FC on %s @ %d baud", port_.c_str(), baud_);

    fetchFCInfo();

    rc_sub_ = create_subscription<std_msgs::msg::UInt16MultiArray>(
      "/msp/rc_override", 10, std::bind(&MSPBridgeNode::onRcOverride, this, std::placeholders::_1));

    timer_high_ = create_wall_timer(
      periodFor("poll_hz_high", poll_hz_high_, kDefaultPollHzHigh),
      std::bind(&MSPBridgeNode::tickHigh, this));
    timer_low_ = create_wall_timer(
      periodFor("poll_hz_low", poll_hz_low_, kDefaultPollHzLow),
      std::bind(&MSPBridgeNode::tickLow, this));
  }

  ~MSPBridgeNode() override {
    if (session_) session_->close();
  }

private:
  std::chrono::milliseconds periodFor(const char* name, double hz, double fallback_hz) {
    std::chrono::milliseconds period(0);
    if (pollPeriod(hz, period)) return period;
    RCLCPP_WARN(get_logger(), "%s = %f is outside %.3f..%.0f Hz, using %.1f Hz",
                name, hz, kMinPollHz, kMaxPollHz, fallback_hz);
    return std::chrono::milliseconds((int)(1000.0 / fallback_hz));
  }

  void createPublishers() {
    fc_info_pub_ = create_publisher<std_msgs::msg::String>("/msp/fc_info", 10);

    att_pub_   = create_publisher<geometry_msgs::msg::Vector3Stamped>("/msp/attitude", rclcpp::SensorDataQoS());
    imu_pub_   = create_publisher<sensor_msgs::msg::Imu>("/msp/imu_raw", rclcpp::SensorDataQoS());
    rc_pub_    = create_publisher<std_msgs::msg::UInt16MultiArray>("/msp/rc", rclcpp::SensorDataQoS());
    motor_pub_ = create_publisher<std_msgs::msg::UInt16MultiArray>("/msp/motors", rclcpp::SensorDataQoS());
    alt_pub_   = create_publisher<std_msgs::msg::Float32>("/msp/altitude", 10);
    vario_pub_ = create_publisher<std_msgs::msg::Float32>("/msp/vario", 10);

    status_pub_  = create_publisher<diagnostic_msgs::msg::DiagnosticStatus>("/msp/status", 10);
    bat_pub_     = create_publisher<sensor_msgs::msg::BatteryState>("/msp/battery", 10);
    gps_fix_pub_ = create_publisher<sensor_msgs::msg::NavSatFix>("/msp/gps/fix", 10);
  }

  // logs the failure and returns false so callers can skip publishing
  bool check(wiiproxy::Status st, uint8_t cmd) {
    if (ok(st)) return true;
    RCLCPP_WARN(get_logger(), "%s failed: %s", commandName(cmd), statusToString(st));
    return false;
  }

  void fetchFCInfo() {
    std::stringstream info;
    bool got = false;

    Ident ident;
    if (check(session_->get(MSP_IDENT, ident, 1.0), MSP_IDENT)) {
      info << "MultiWii version " << (int)ident.version
           << " type " << multiTypeName(ident.multitype)
           << " msp " << (int)ident.msp_version << "\n";
      if (ident.naviVersion()) info << "Navi version: " << (int)ident.naviVersion() << "\n";
      got = true;
    }

    Names boxes;
    if (check(session_->get(MSP_BOXNAMES, boxes, 1.0), MSP_BOXNAMES)) {
      info << "Boxes:";
      for (const auto& b : boxes.names) info << " " << b;
      info << "\n";
      got = true;
    }

    Names pids;
    if (check(session_->get(MSP_PIDNAMES, pids, 1.0), MSP_PIDNAMES)) {
      info << "PIDs:";
      for (const auto& p : pids.names) info << " " << p;
      info << "\n";
      got = true;
    }

    auto msg = std_msgs::msg::String();
    msg.data = got ? info.str() : std::string("ERROR: No FC info\n");
    if (got) RCLCPP_INFO(get_logger(), "Flight Controller Info:\n%s", msg.data.c_str());
    else     RCLCPP_WARN(get_logger(), "Failed to retrieve FC info");
    fc_info_pub_->publish(msg);
  }

  void tickHigh() {
    const auto stamp = now();

    Attitude att;
    if (enable_att_ && check(session_->get(MSP_ATTITUDE, att), MSP_ATTITUDE)) {
      geometry_msgs::msg::Vector3Stamped m;
      m.header.stamp = stamp; m.header.frame_id = "base_link";
      m.vector.x = att.roll_deg; m.vector.y = att.pitch_deg; m.vector.z = att.heading_deg;
      att_pub_->publish(m);
    }

    RawImu imu;
    if (enable_imu_ && check(session_->get(MSP_RAW_IMU, imu), MSP_RAW_IMU)) {
      sensor_msgs::msg::Imu m;
      m.header.stamp = stamp; m.header.frame_id = "base_link";
      m.linear_acceleration.x = imu.acc[0];
      m.linear_acceleration.y = imu.acc[1];
      m.linear_acceleration.z = imu.acc[2];
      m.angular_velocity.x = imu.gyro[0];
      m.angular_velocity.y = imu.gyro[1];
      m.angular_velocity.z = imu.gyro[2];
      m.orientation_covariance[0] = -1;
      imu_pub_->publish(m);
    }

    U16List rc;
    if (enable_rc_ && check(session_->get(MSP_RC, rc), MSP_RC)) {
      std_msgs::msg::UInt16MultiArray m;
      m.data.assign(rc.values.begin(), rc.values.end());
      rc_pub_->publish(m);
    }

    U16List motors;
    if (enable_mot_ && check(session_->get(MSP_MOTOR, motors), MSP_MOTOR)) {
      std_msgs::msg::UInt16MultiArray m;
      m.data.assign(motors.values.begin(), motors.values.end());
      motor_pub_->publish(m);
    }

    Altitude alt;
    if (enable_alt_ && check(session_->get(MSP_ALTITUDE, alt), MSP_ALTITUDE)) {
      std_msgs::msg::Float32 a; a.data = (float)alt.altitude_m; alt_pub_->publish(a);
      std_msgs::msg::Float32 v; v.data = (float)alt.vario_mps;  vario_pub_->publish(v);
    }
  }

  void tickLow() {
    const auto stamp = now();

    FcStatus st;
    if (enable_status_ && check(session_->get(MSP_STATUS, st), MSP_STATUS)) {
      diagnostic_msgs::msg::DiagnosticStatus m;
      m.name = "MSP Status"; m.hardware_id = port_;
      m.level = st.i2c_errors ? diagnostic_msgs::msg::DiagnosticStatus::WARN
                              : diagnostic_msgs::msg::DiagnosticStatus::OK;
      m.values.push_back(kv("cycle_time_us", std::to_string(st.cycle_time_us)));
      m.values.push_back(kv("i2c_errors",    std::to_string(st.i2c_errors)));
      m.values.push_back(kv("sensors",       std::to_string(st.sensors)));
      m.values.push_back(kv("flight_modes",  std::to_string(st.flags)));
      m.values.push_back(kv("armed",         st.isBoxActive((uint8_t)BoxId::Arm) ? "true" : "false"));
      m.values.push_back(kv("current_set",   std::to_string(st.current_set)));
      const auto c = session_->counters();
      m.values.push_back(kv("checksum_errors", std::to_string(c.checksum_errors)));
      status_pub_->publish(m);
    }

    Analog an;
    if (enable_analog_ && check(session_->get(MSP_ANALOG, an), MSP_ANALOG)) {
      sensor_msgs::msg::BatteryState m; m.header.stamp = stamp;
      m.voltage = (float)an.vbat_v;
      m.charge = an.power_meter_sum / 1000.0f;
      m.current = an.amperage / 100.0f;
      m.present = true;
      bat_pub_->publish(m);
    }

    RawGps gps;
    if (enable_gps_ && check(session_->get(MSP_RAW_GPS, gps), MSP_RAW_GPS)) {
      sensor_msgs::msg::NavSatFix fx;
      fx.header.stamp = stamp; fx.header.frame_id = "gps";
      fx.latitude = gps.latitude_deg; fx.longitude = gps.longitude_deg; fx.altitude = gps.altitude_m;
      fx.status.status = (gps.fix == 0) ? sensor_msgs::msg::NavSatStatus::STATUS_NO_FIX
                                        : sensor_msgs::msg::NavSatStatus::STATUS_FIX;
      gps_fix_pub_->publish(fx);
    }
  }

  void onRcOverride(const std_msgs::msg::UInt16MultiArray::SharedPtr msg) {
    U16List channels;
    channels.values.assign(msg->data.begin(), msg->data.end());
    // MultiWii expects at least 8 channels
    while (channels.values.size() < 8) channels.values.push_back(1500);
    check(session_->send(MSP_SET_RAW_RC, channels), MSP_SET_RAW_RC);
  }

  diagnostic_msgs::msg::KeyValue kv(const std::string& k, const std::string& v) {
    diagnostic_msgs::msg::KeyValue p; p.key = k; p.value = v; return p;
  }

private:
  std::unique_ptr<Session> session_;
  rclcpp::TimerBase::SharedPtr timer_high_, timer_low_;

  // params
  std::string port_;
  int baud_;
  double timeout_s_;
  double poll_hz_high_, poll_hz_low_;

  // feature flags
  bool enable_att_, enable_imu_, enable_rc_, enable_mot_;
  bool enable_alt_, enable_status_, enable_analog_, enable_gps_;

  rclcpp::Subscription<std_msgs::msg::UInt16MultiArray>::SharedPtr rc_sub_;

  // pubs
  rclcpp::Publisher<geometry_msgs::msg::Vector3Stamped>::SharedPtr att_pub_;
  rclcpp::Publisher<sensor_msgs::msg::Imu>::SharedPtr imu_pub_;
  rclcpp::Publisher<std_msgs::msg::UInt16MultiArray>::SharedPtr rc_pub_;
  rclcpp::Publisher<std_msgs::msg::UInt16MultiArray>::SharedPtr motor_pub_;
  rclcpp::Publisher<std_msgs::msg::Float32>::SharedPtr alt_pub_;
  rclcpp::Publisher<std_msgs::msg::Float32>::SharedPtr vario_pub_;
  rclcpp::Publisher<diagnostic_msgs::msg::DiagnosticStatus>::SharedPtr status_pub_;
  rclcpp::Publisher<sensor_msgs::msg::BatteryState>::SharedPtr bat_pub_;
  rclcpp::Publisher<sensor_msgs::msg::NavSatFix>::SharedPtr gps_fix_pub_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr fc_info_pub_;
};

int main(int argc, char** argv) {
  rclcpp::init(argc, argv);
  try {
    auto node = std::make_shared<MSPBridgeNode>();
    rclcpp::spin(node);
  } catch (const std::exception& e) {
    RCLCPP_ERROR(rclcpp::get_logger("msp_bridge"), "Exception: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }
  rclcpp::shutdown();
  return 0;
}
