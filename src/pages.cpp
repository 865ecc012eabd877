/**
 * Handfont — HTML pages
 *
 * Plain server-rendered pages. Anything that came from a client or from the
 * tool's output goes through html_escape() first.
 */

#include "pages.h"
#include "artifact.h"

static string page(const string& title, const string& body) {
    return string(R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>)HTML") + html_escape(title) + R"HTML( - Handfont</title>
<style>
*{box-sizing:border-box}
body{max-width:640px;margin:40px auto;padding:0 16px;font-family:-apple-system,BlinkMacSystemFont,'Segoe UI',sans-serif;color:#1d1d26}
h1{font-size:1.6rem}
.flash{background:#fdecea;border:1px solid #f5c2c0;color:#8a1c17;padding:10px 14px;border-radius:6px;white-space:pre-wrap}
label{display:block;margin:14px 0 4px;font-weight:600}
input[type=text]{width:100%;padding:8px}
button,.btn{display:inline-block;margin-top:18px;padding:10px 18px;background:#5b4cdb;color:#fff;border:0;border-radius:6px;text-decoration:none;cursor:pointer}
</style>
</head>
<body>
)HTML" + body + R"HTML(
</body>
</html>
)HTML";
}

string index_html() {
    return page("Handwriting to font", R"HTML(<h1>Turn your handwriting into a font</h1>
<ol>
  <li><a href="/download-template">Download the template</a> and print it.</li>
  <li>Fill in every box with your handwriting, then scan or photograph the sheet.</li>
  <li><a href="/generate">Upload the image</a> and choose a family and style name.</li>
</ol>
<p>Your generated font can be downloaded once. It is deleted from the server right after.</p>
<a class="btn" href="/generate">Create a font</a>)HTML");
}

string generate_html(const string& message) {
    string body = "<h1>Create your font</h1>\n";

    if (!message.empty()) {
        body += "<div class=\"flash\">" + html_escape(message) + "</div>\n";
    }

    body += R"HTML(<form method="post" action="/generate" enctype="multipart/form-data">
  <label for="pngfile">Filled-in template (PNG or JPG)</label>
  <input type="file" id="pngfile" name="pngfile" accept=".png,.jpg,.jpeg" required>
  <label for="family">Font family</label>
  <input type="text" id="family" name="family" placeholder="My Handwriting" required>
  <label for="style">Style</label>
  <input type="text" id="style" name="style" placeholder="Regular" required>
  <label for="filename">File name</label>
  <input type="text" id="filename" name="filename" placeholder="myfont" required>
  <button type="submit">Generate</button>
</form>)HTML";

    return page("Create your font", body);
}

string download_html(const string& key) {
    string name = html_escape(artifact_filename(key));
    string body = "<h1>Your font is ready</h1>\n"
                  "<p><strong>" + name + "</strong> can be downloaded once. "
                  "After that it is removed from the server.</p>\n"
                  "<a class=\"btn\" href=\"" + html_escape(artifact_file_url(key)) + "\">Download " + name + "</a>\n"
                  "<p><a href=\"/generate\">Make another font</a></p>";
    return page("Download", body);
}

string error_html(int status, const string& message) {
    string body = "<h1>" + to_string(status) + "</h1>\n<p>" + html_escape(message) + "</p>\n"
                  "<p><a href=\"/\">Back to start</a></p>";
    return page("Error " + to_string(status), body);
}
