/**
 * @file   channel_config.hpp
 * @brief  Defines the data channel configuration model and its JSON
 *         persistence API.
 *
 * Declares ChannelConfig (passive bind settings, TLS material, active
 * options) and loadFile()/saveFile() to read/write it as JSON with basic
 * validation.
 *
 * @date   2026-10-19
 */

 #ifndef FTP_DATA_CHANNEL_CONFIG_HPP
 #define FTP_DATA_CHANNEL_CONFIG_HPP

 #include <string>
 #include <nlohmann/json.hpp>
 using ordered_json = nlohmann::ordered_json;

 namespace ftp_data::config {

 /**
  * @struct PassiveSettings
  * @brief Where passive data channels listen.
  */
 struct PassiveSettings {
     std::string host;       ///< Bind host ("" = all interfaces)
     int         port = 0;   ///< Fixed port, 0 = ephemeral
 };

 /**
  * @struct ActiveSettings
  * @brief Options for active (dial-out) data channels.
  */
 struct ActiveSettings {
     bool tls = false;       ///< Negotiate TLS on dialed connections too
 };

 /**
  * @struct TlsSettings
  * @brief PEM files used to build the server TLS context.
  */
 struct TlsSettings {
     bool        enabled = false;
     std::string certFile;   ///< Certificate chain (PEM)
     std::string keyFile;    ///< Private key (PEM)
 };

 /**
  * @struct ChannelConfig
  * @brief Complete configuration of the data channel layer.
  */
 struct ChannelConfig {
     std::string     sessionId = "datachan";  ///< Tag for diagnostic lines
     PassiveSettings passive;
     ActiveSettings  active;
     TlsSettings     tls;
 };

 /**
  * @brief Checks ranges and required fields.
  *
  * @param cfg  Configuration to check.
  * @param err  Optional out-param receiving the first problem found.
  * @return     true if the configuration is usable.
  */
 bool validate(const ChannelConfig& cfg, std::string* err = nullptr);

 /**
  * @brief Load a configuration from a JSON file on disk.
  *
  * Missing sections keep their defaults; unknown keys are ignored.
  *
  * @param path File path to read from.
  * @param out  Configuration to populate upon success.
  * @param err  Optional out-param for an error message on failure.
  * @return     false on I/O, parse, schema or validation errors.
  */
 bool loadFile(const std::string& path,
               ChannelConfig& out,
               std::string* err = nullptr);

 /**
  * @brief Save a configuration to disk as JSON.
  *
  * @param cfg    Configuration to serialize.
  * @param path   Output file path.
  * @param pretty Whether to pretty-print with indentation.
  * @param err    Optional out-param for error messages on failure.
  * @return       true on success.
  */
 bool saveFile(const ChannelConfig& cfg,
               const std::string& path,
               bool pretty = true,
               std::string* err = nullptr);

 } // namespace ftp_data::config

 // ----------------------------------------------------------------------------
 // nlohmann::json ADL serializers for configuration types
 // ----------------------------------------------------------------------------
 namespace nlohmann {

 template <>
 struct adl_serializer<ftp_data::config::PassiveSettings> {
     static void to_json(ordered_json& j, ftp_data::config::PassiveSettings const& p) {
         j = ordered_json{
             {"host", p.host},
             {"port", p.port}
         };
     }
     static void from_json(ordered_json const& j, ftp_data::config::PassiveSettings& p) {
         if (j.contains("host")) j.at("host").get_to(p.host);
         if (j.contains("port")) j.at("port").get_to(p.port);
     }
 };

 template <>
 struct adl_serializer<ftp_data::config::ActiveSettings> {
     static void to_json(ordered_json& j, ftp_data::config::ActiveSettings const& a) {
         j = ordered_json{{"tls", a.tls}};
     }
     static void from_json(ordered_json const& j, ftp_data::config::ActiveSettings& a) {
         if (j.contains("tls")) j.at("tls").get_to(a.tls);
     }
 };

 template <>
 struct adl_serializer<ftp_data::config::TlsSettings> {
     static void to_json(ordered_json& j, ftp_data::config::TlsSettings const& t) {
         j = ordered_json{{"enabled", t.enabled}};
         if (!t.certFile.empty()) j["certFile"] = t.certFile;
         if (!t.keyFile.empty())  j["keyFile"]  = t.keyFile;
     }
     static void from_json(ordered_json const& j, ftp_data::config::TlsSettings& t) {
         if (j.contains("enabled"))  j.at("enabled").get_to(t.enabled);
         if (j.contains("certFile")) j.at("certFile").get_to(t.certFile);
         if (j.contains("keyFile"))  j.at("keyFile").get_to(t.keyFile);
     }
 };

 template <>
 struct adl_serializer<ftp_data::config::ChannelConfig> {
     static void to_json(ordered_json& j, ftp_data::config::ChannelConfig const& c) {
         j = ordered_json{
             {"sessionId", c.sessionId},
             {"passive",   c.passive},
             {"active",    c.active},
             {"tls",       c.tls}
         };
     }
     static void from_json(ordered_json const& j, ftp_data::config::ChannelConfig& c) {
         if (j.contains("sessionId")) j.at("sessionId").get_to(c.sessionId);
         if (j.contains("passive"))   j.at("passive")  .get_to(c.passive);
         if (j.contains("active"))    j.at("active")   .get_to(c.active);
         if (j.contains("tls"))       j.at("tls")      .get_to(c.tls);
     }
 };

 } // namespace nlohmann

 #endif // FTP_DATA_CHANNEL_CONFIG_HPP
