#include "server/server.hpp"
#include "test_support.hpp"

static Request make_request(const std::string &path,
                            const std::string &method = "GET") {
  Request req;
  req.method = method;
  req.path = path;
  req.version = "HTTP/1.1";
  return req;
}

int main() {
  TempDir site("preview-static");
  site.write("index.html", "hello world\n");
  site.write("about.html", "<h1>About</h1>\n");
  site.write("css/site.css", "body { margin: 0; }\n");
  site.write("docs/guide.md", "# Guide\n");
  site.write("docs/notes file.txt", "notes\n");
  site.write("blog/index.htm", "<p>blog</p>\n");
  site.write("data.bin", std::string("\x00\x01\x02\xff", 4));

  Server svr(site.path);

  {
    Response res = svr.handle(make_request("/index.html"));
    check(res.status == 200, "existing file returns 200");
    check(res.body == "hello world\n" && res.body.size() == 12,
          "existing file returns its exact 12 bytes");
    check(res.headers["Content-Type"] == "text/html",
          "html file is typed text/html");
  }

  {
    Response res = svr.handle(make_request("/missing.html"));
    check(res.status == 404, "missing file returns 404");
  }

  {
    Response res = svr.handle(make_request("/"));
    check(res.status == 200 && res.body == "hello world\n",
          "root serves index.html");
  }

  {
    Response res = svr.handle(make_request("/index.html?v=3#top"));
    check(res.status == 200 && res.body == "hello world\n",
          "query and fragment are ignored");
  }

  {
    Response res = svr.handle(make_request("/css/site.css"));
    check(res.headers["Content-Type"] == "text/css", "css is typed text/css");
  }

  {
    Response res = svr.handle(make_request("/data.bin"));
    check(res.status == 200 && res.body.size() == 4 &&
              res.body[0] == '\0' && res.body[3] == '\xff',
          "binary file served byte for byte");
    check(res.headers["Content-Type"] == "application/octet-stream",
          "unknown extension falls back to octet-stream");
  }

  {
    Response res = svr.handle(make_request("/docs/notes%20file.txt"));
    check(res.status == 200 && res.body == "notes\n",
          "percent-encoded path is decoded");
  }

  {
    Response res = svr.handle(make_request("/docs"));
    check(res.status == 301 && res.headers["Location"] == "/docs/",
          "directory without slash redirects");
  }

  {
    Response res = svr.handle(make_request("/docs?x=1#top"));
    check(res.status == 301 && res.headers["Location"] == "/docs/?x=1",
          "redirect keeps the query string");
  }

  {
    Response res = svr.handle(make_request("/blog/"));
    check(res.status == 200 && res.body == "<p>blog</p>\n",
          "index.htm is used when index.html is absent");
  }

  {
    Response res = svr.handle(make_request("/docs/"));
    check(res.status == 200, "directory without index lists entries");
    check(res.body.find("guide.md") != std::string::npos &&
              res.body.find("notes%20file.txt") != std::string::npos,
          "listing links every entry");
    check(res.body.find("guide.md") < res.body.find("notes file.txt"),
          "listing is sorted");
  }

  {
    Response res = svr.handle(make_request("/../etc/passwd"));
    check(res.status == 403, "parent traversal is forbidden");
    Response encoded = svr.handle(make_request("/docs/%2e%2e/%2e%2e/x"));
    check(encoded.status == 403, "encoded traversal is forbidden");
  }

  {
    Response res = svr.handle(make_request("//etc/hostname"));
    check(res.status == 404, "absolute paths stay inside the root");
  }

  {
    Response res = svr.handle(make_request("/docs/../about.html"));
    check(res.status == 200 && res.body == "<h1>About</h1>\n",
          "inner .. that stays in the root is allowed");
  }

  {
    Response res = svr.handle(make_request("/index.html", "HEAD"));
    check(res.status == 200, "HEAD is supported");
    std::string wire = res.to_http(false);
    check(wire.find("Content-Length: 12\r\n") != std::string::npos &&
              wire.size() >= 4 && wire.compare(wire.size() - 4, 4,
                                               "\r\n\r\n") == 0,
          "HEAD response carries headers only");
  }

  {
    Response res = svr.handle(make_request("/index.html", "POST"));
    check(res.status == 501, "unsupported methods return 501");
  }

  {
    Response res = svr.handle(make_request("relative"));
    check(res.status == 400, "target without leading slash is rejected");
  }

  check(Server::get_mime_type("app.JS") == "application/javascript",
        "extension match ignores case");
  check(Server::get_mime_type("logo.svg") == "image/svg+xml",
        "svg is typed image/svg+xml");

  return finish();
}
