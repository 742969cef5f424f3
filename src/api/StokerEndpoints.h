#pragma once

namespace StokerEndpoints {

constexpr const char* kLoginPath = "login.php";
constexpr const char* kControllerDataPath = "controllerdata2.php";
constexpr const char* kEventDataPath = "geteventdata.php";

// Screen query captured from the vendor web UI. Selects which boiler,
// DHW, hopper and weather values the controller data response carries.
constexpr const char* kScreen =
  "b1,3,b2,5,b3,4,b4,6,b5,12,b6,14,b7,15,b8,16,b9,9,"
  "b10,0,"
  "d1,3,d2,4,d3,0,d4,0,d5,0,d6,0,d7,0,d8,0,d9,0,d10,0,"
  "h1,2,h2,3,h3,4,h4,7,h5,8,h6,0,h7,0,h8,0,h9,0,h10,0,"
  "w1,2,w2,3,w3,9,w4,0,w5,0";

// Top-level field every valid controller data payload carries.
constexpr const char* kControllerMarker = "miscdata";

} // namespace StokerEndpoints
