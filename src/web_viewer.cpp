#include "web_viewer.hpp"
#include "archive_index.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <chrono>

namespace chatbackup {

static const char* VIEWER_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Chat Backup</title>
<style>
*{margin:0;padding:0;box-sizing:border-box}
:root{--primary:#E86A33;--primary-light:#F49A6C;--bg:#FAF8F5;--card:#fff;--text:#3E3832;--dim:#8B7E74;--border:#E8DED4}
body{font-family:'Segoe UI',system-ui,sans-serif;background:var(--bg);color:var(--text);min-height:100vh}
.container{max-width:1100px;margin:0 auto;padding:20px}
header{background:linear-gradient(135deg,var(--primary),var(--primary-light));color:#fff;padding:24px 20px;border-radius:14px;margin-bottom:20px;text-align:center}
header h1{font-size:1.6rem;font-weight:600}
.stats{display:grid;grid-template-columns:repeat(auto-fit,minmax(140px,1fr));gap:14px;margin-bottom:20px}
.stat{background:var(--card);border:1px solid var(--border);border-radius:12px;padding:16px;text-align:center}
.stat .v{font-size:1.8rem;font-weight:700;color:var(--primary)}
.stat .l{color:var(--dim);font-size:.85rem;margin-top:4px}
.list{display:grid;gap:10px}
.item{background:var(--card);border:1px solid var(--border);border-radius:12px;padding:14px 18px;cursor:pointer;display:flex;justify-content:space-between;align-items:center;transition:all .2s}
.item:hover{border-color:var(--primary);transform:translateY(-1px)}
.item h3{font-size:1rem;margin-bottom:4px}
.item .preview{color:var(--dim);font-size:.85rem}
.meta{text-align:right;font-size:.85rem;color:var(--dim)}
.meta .count{color:var(--primary);font-weight:600}
.badge{display:inline-block;padding:2px 8px;border-radius:4px;font-size:.75rem;margin-left:8px}
.badge.private{background:#E3F2FD;color:#1976D2}
.badge.group{background:#E8F5E9;color:#388E3C}
.badge.archived{background:#EEE;color:#666}
.modal{display:none;position:fixed;inset:0;background:rgba(0,0,0,.5);z-index:10}
.modal.active{display:flex;align-items:center;justify-content:center}
.box{background:var(--card);border-radius:14px;width:90%;max-width:700px;max-height:80vh;display:flex;flex-direction:column;overflow:hidden}
.box-head{padding:16px 20px;border-bottom:1px solid var(--border);display:flex;justify-content:space-between;align-items:center}
.box-head button{background:none;border:none;font-size:1.5rem;cursor:pointer;color:var(--dim)}
.box-body{padding:16px 20px;overflow-y:auto;flex:1}
.msg{margin-bottom:12px;padding:10px 14px;border-radius:10px}
.msg.user{background:#E3F2FD;margin-left:40px}
.msg.assistant{background:#FFF3E0;margin-right:40px}
.msg .m{font-size:.75rem;color:var(--dim);margin-bottom:4px}
.msg .c{white-space:pre-wrap;word-break:break-word}
.more{text-align:center;padding:12px}
.more button{background:var(--primary);color:#fff;border:none;padding:8px 20px;border-radius:8px;cursor:pointer}
.empty{text-align:center;padding:60px 20px;color:var(--dim)}
</style>
</head>
<body>
<div class="container">
  <header><h1>Chat Backup</h1></header>
  <div class="stats" id="stats"></div>
  <div class="list" id="list"></div>
</div>
<div class="modal" id="modal">
  <div class="box">
    <div class="box-head"><h2 id="title"></h2><button id="close">&times;</button></div>
    <div class="box-body" id="body"></div>
  </div>
</div>
<script>
const PAGE=30;
let current=null,page=1;

function el(tag,cls,text){
  const d=document.createElement(tag);
  if(cls)d.className=cls;
  if(text!==undefined)d.textContent=text;
  return d;
}

async function loadStats(){
  const s=await (await fetch('/api/stats')).json();
  const box=document.getElementById('stats');
  box.innerHTML='';
  [['total_chats','Chats'],['total_messages','Messages'],['private_chats','Private'],
   ['group_chats','Groups'],['total_size_mb','Storage (MB)']].forEach(([k,l])=>{
    const c=el('div','stat');
    c.appendChild(el('div','v',String(s[k])));
    c.appendChild(el('div','l',l));
    box.appendChild(c);
  });
}

async function loadChats(){
  const chats=await (await fetch('/api/chats')).json();
  const list=document.getElementById('list');
  list.innerHTML='';
  if(chats.length===0){
    list.appendChild(el('div','empty','No backups yet. Messages show up here once they are recorded.'));
    return;
  }
  chats.forEach(c=>{
    const item=el('div','item');
    const info=el('div');
    const h=el('h3',null,c.chat_id);
    h.appendChild(el('span','badge '+c.type,c.type));
    if(c.archived)h.appendChild(el('span','badge archived','archived'));
    info.appendChild(h);
    info.appendChild(el('div','preview',c.last_message||'(no messages)'));
    const meta=el('div','meta');
    meta.appendChild(el('div','count',c.message_count+' messages'));
    meta.appendChild(el('div',null,c.size_kb+' KB'));
    item.appendChild(info);
    item.appendChild(meta);
    item.onclick=()=>openChat(c.filename,c.chat_id);
    list.appendChild(item);
  });
}

async function openChat(file,id){
  current=file;page=1;
  document.getElementById('title').textContent='Chat '+id;
  document.getElementById('body').innerHTML='';
  await loadMessages();
  document.getElementById('modal').classList.add('active');
}

async function loadMessages(){
  const res=await fetch('/api/chat/'+encodeURIComponent(current)+'?page='+page+'&size='+PAGE);
  const data=await res.json();
  const body=document.getElementById('body');
  const old=body.querySelector('.more');
  if(old)old.remove();
  (data.messages||[]).forEach(m=>{
    const d=el('div','msg '+m.role);
    d.appendChild(el('div','m',(m.sender_name||m.role)+' · '+new Date(m.timestamp).toLocaleString()));
    d.appendChild(el('div','c',m.content));
    body.appendChild(d);
  });
  if(page*PAGE<data.total){
    const more=el('div','more');
    const b=el('button',null,'Load more');
    b.onclick=()=>{page++;loadMessages();};
    more.appendChild(b);
    body.appendChild(more);
  }
}

document.getElementById('close').onclick=()=>document.getElementById('modal').classList.remove('active');
document.getElementById('modal').addEventListener('click',e=>{if(e.target.id==='modal')e.target.classList.remove('active');});
loadStats();
loadChats();
</script>
</body>
</html>)HTML";

static void json_error(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    nlohmann::json err;
    err["error"] = msg;
    res.set_content(err.dump(), "application/json");
}

static bool query_int(const httplib::Request& req, const char* key, int fallback, int& out) {
    out = fallback;
    if (!req.has_param(key)) return true;
    try {
        size_t used = 0;
        std::string v = req.get_param_value(key);
        out = std::stoi(v, &used);
        return used == v.size();
    } catch (const std::exception&) {
        return false;
    }
}

WebViewer::WebViewer(const std::string& host, int port, const std::string& data_dir,
                     ArchiveIndex* archives)
    : host_(host), port_(port), reader_(data_dir), archives_(archives) {}

WebViewer::~WebViewer() {
    stop();
}

void WebViewer::setup_routes() {
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(VIEWER_HTML, "text/html; charset=utf-8");
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server_.Get("/api/chats", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json arr = nlohmann::json::array();
        for (auto& s : reader_.list_logs()) arr.push_back(s.to_json());
        res.set_content(arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });

    server_.Get(R"(/api/chat/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        int page = 1, size = 50;
        if (!query_int(req, "page", 1, page) || !query_int(req, "size", 50, size)) {
            json_error(res, 400, "page and size must be integers");
            return;
        }
        auto result = reader_.read_page(req.matches[1].str(), page, size);
        if (!result) {
            json_error(res, 404, "Chat not found");
            return;
        }
        res.set_content(result->to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });

    server_.Get("/api/stats", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(reader_.stats().to_json().dump(), "application/json");
    });

    server_.Get("/api/archives", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json arr = nlohmann::json::array();
        if (archives_) {
            std::string chat = req.has_param("chat") ? req.get_param_value("chat") : "";
            for (auto& a : archives_->list(chat)) {
                arr.push_back({
                    {"id", a.id},
                    {"chat_id", a.chat_id},
                    {"type", a.kind},
                    {"filename", a.filename},
                    {"size_bytes", a.size_bytes},
                    {"record_count", a.record_count},
                    {"rotated_at", a.rotated_at},
                });
            }
        }
        res.set_content(arr.dump(), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[webui] Unhandled exception: " << msg << "\n";
        json_error(res, 500, msg);
    });
}

bool WebViewer::start() {
    if (running_) return true;
    setup_routes();

    if (port_ == 0) {
        int bound = server_.bind_to_any_port(host_);
        if (bound <= 0) {
            std::cerr << "[webui] Failed to bind " << host_ << " on any port\n";
            return false;
        }
        port_ = bound;
    } else if (!server_.bind_to_port(host_, port_)) {
        std::cerr << "[webui] Failed to bind " << host_ << ":" << port_ << "\n";
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        std::cerr << "[webui] Chat backup viewer on http://" << host_ << ":" << port_ << "\n";
        server_.listen_after_bind();
        running_ = false;
    });
    return true;
}

void WebViewer::stop() {
    if (thread_.joinable()) {
        // stop() is a no-op until listen_after_bind() has marked the server running.
        for (int i = 0; i < 1000 && running_ && !server_.is_running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        server_.stop();
        thread_.join();
        std::cerr << "[webui] Viewer stopped\n";
    }
    running_ = false;
}

} // namespace chatbackup
