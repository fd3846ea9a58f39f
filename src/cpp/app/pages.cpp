#include "pages.h"

namespace piping {
namespace app {

const std::vector<std::string>& reserved_paths() {
    static const std::vector<std::string> reserved = {
        paths::INDEX,
        paths::NOSCRIPT,
        paths::VERSION,
        paths::HELP,
        paths::ROBOTS,
        paths::FAVICON
    };
    return reserved;
}

bool is_reserved_path(std::string_view path) {
    for (const auto& reserved : reserved_paths()) {
        if (reserved == path) {
            return true;
        }
    }
    return false;
}

std::string html_escape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string base_url(const http::Request& request) {
    std::string url = request.secure() ? "https://" : "http://";
    const std::string* host = request.header("host");
    url += (host && !host->empty()) ? *host : "localhost";
    return url;
}

std::string index_page() {
    std::string page;
    page.reserve(4096);
    page += R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>Piping Server</title>
<style>
  body { font-family: sans-serif; max-width: 40em; margin: 2em auto; padding: 0 1em; }
  h1 { font-size: 1.6em; }
  textarea { width: 100%; height: 8em; }
  .row { margin: 1em 0; }
  #progress { width: 100%; }
</style>
</head>
<body>
<h1>Piping Server</h1>
<p>Streaming data transfer over pure HTTP. Version )HTML";
    page += PIPING_VERSION;
    page += R"HTML(.</p>
<div class="row">
  <label><input type="radio" name="mode" value="file" checked> File</label>
  <label><input type="radio" name="mode" value="text"> Text</label>
</div>
<div class="row" id="file-input"><input type="file" id="file"></div>
<div class="row" id="text-input" style="display:none"><textarea id="text" placeholder="Text to send"></textarea></div>
<div class="row"><input type="text" id="path" placeholder="Path (e.g. abcd1234)" size="40"></div>
<div class="row"><button id="send">Send</button></div>
<div class="row"><progress id="progress" value="0" max="100"></progress></div>
<pre id="message"></pre>
<p><a href="/noscript">Page without JavaScript</a> | <a href="/help">Command-line usage</a></p>
<script>
(function () {
  var modes = document.getElementsByName("mode");
  function mode() {
    for (var i = 0; i < modes.length; i++) { if (modes[i].checked) return modes[i].value; }
    return "file";
  }
  for (var i = 0; i < modes.length; i++) {
    modes[i].onchange = function () {
      var file = mode() === "file";
      document.getElementById("file-input").style.display = file ? "" : "none";
      document.getElementById("text-input").style.display = file ? "none" : "";
    };
  }
  document.getElementById("send").onclick = function () {
    var message = document.getElementById("message");
    var path = document.getElementById("path").value;
    if (path === "") { message.textContent = "Specify a path."; return; }
    if (path.charAt(0) !== "/") { path = "/" + path; }
    var body;
    if (mode() === "file") {
      var files = document.getElementById("file").files;
      if (files.length === 0) { message.textContent = "Select a file."; return; }
      body = files[0];
    } else {
      body = new Blob([document.getElementById("text").value], { type: "text/plain" });
    }
    var xhr = new XMLHttpRequest();
    var progress = document.getElementById("progress");
    xhr.upload.onprogress = function (e) {
      if (e.lengthComputable) { progress.value = e.loaded / e.total * 100; }
    };
    xhr.onload = function () { message.textContent = xhr.responseText; };
    xhr.onerror = function () { message.textContent = "Upload failed."; };
    xhr.open("POST", path, true);
    xhr.send(body);
    message.textContent = "Waiting for a receiver on " + path + " ...";
  };
})();
</script>
</body>
</html>
)HTML";
    return page;
}

std::string noscript_page(std::string_view path, std::string_view mode) {
    bool text_mode = (mode == "text");

    std::string action(path);
    if (action.empty() || action.front() != '/') {
        action.insert(action.begin(), '/');
    }
    std::string escaped_action = html_escape(action);
    std::string escaped_path = html_escape(path);

    std::string page;
    page.reserve(2048);
    page += R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>Piping Server (no script)</title>
<style>
  body { font-family: sans-serif; max-width: 40em; margin: 2em auto; padding: 0 1em; }
  textarea { width: 100%; height: 8em; }
</style>
</head>
<body>
<h1>Piping Server</h1>
<form method="GET" action="/noscript">
  <input type="text" name="path" value=")HTML";
    page += escaped_path;
    page += R"HTML(" placeholder="Path" size="30">
  <input type="hidden" name="mode" value=")HTML";
    page += text_mode ? "text" : "file";
    page += R"HTML(">
  <input type="submit" value="Apply">
</form>
<p>
  <a href="/noscript?path=)HTML";
    page += escaped_path;
    page += R"HTML(&amp;mode=file">File</a> |
  <a href="/noscript?path=)HTML";
    page += escaped_path;
    page += R"HTML(&amp;mode=text">Text</a>
</p>
)HTML";

    if (!path.empty()) {
        page += "<form method=\"POST\" action=\"";
        page += escaped_action;
        page += "\" enctype=\"multipart/form-data\">\n";
        if (text_mode) {
            page += "  <textarea name=\"input_text\" placeholder=\"Text to send\"></textarea>\n";
        } else {
            page += "  <input type=\"file\" name=\"input_file\">\n";
        }
        page += "  <input type=\"submit\" value=\"Send\">\n";
        page += "</form>\n";
        page += "<p>Receive with: <code>curl ";
        page += "&lt;this server&gt;";
        page += escaped_action;
        page += "</code></p>\n";
    } else {
        page += "<p>Enter a path first.</p>\n";
    }

    page += "</body>\n</html>\n";
    return page;
}

std::string help_text(std::string_view base_url) {
    std::string url(base_url);

    std::string text;
    text.reserve(1024);
    text += "Help for Piping Server ";
    text += PIPING_VERSION;
    text += "\n\n";
    text += "======= Get  =======\n";
    text += "curl " + url + "/mypath\n";
    text += "\n";
    text += "======= Send =======\n";
    text += "# Send a file\n";
    text += "curl -T myfile " + url + "/mypath\n";
    text += "\n";
    text += "# Send a text\n";
    text += "echo 'hello!' | curl -T - " + url + "/mypath\n";
    text += "\n";
    text += "# Send a directory (zip)\n";
    text += "zip -q -r - ./mydir | curl -T - " + url + "/mypath\n";
    text += "\n";
    text += "# Send a directory (tar.gz)\n";
    text += "tar zfcp - ./mydir | curl -T - " + url + "/mypath\n";
    text += "\n";
    text += "# Encryption\n";
    text += "## Send\n";
    text += "cat myfile | openssl aes-256-cbc | curl -T - " + url + "/mypath\n";
    text += "## Get\n";
    text += "curl " + url + "/mypath | openssl aes-256-cbc -d\n";
    text += "\n";
    text += "======= Multiple receivers =======\n";
    text += "# Send to 3 receivers\n";
    text += "curl -T myfile '" + url + "/mypath?n=3'\n";
    text += "# Each receiver\n";
    text += "curl '" + url + "/mypath?n=3'\n";
    return text;
}

std::string version_text() {
    return std::string(PIPING_VERSION) + "\n";
}

} // namespace app
} // namespace piping
