#include "tracker/http_gateway.hpp"

namespace tracker {

namespace {

// Polls the list endpoint every 5 seconds. Values are inserted with
// textContent, never innerHTML.
constexpr std::string_view kDashboardHtml = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Player Tracker</title>
<style>
body { font-family: 'Segoe UI', Tahoma, sans-serif; background: #f8f9fa; color: #212529; margin: 0; }
body.dark { background: #222; color: #eee; }
.container { max-width: 1200px; margin: 0 auto; padding: 20px; }
header { display: flex; justify-content: space-between; align-items: center; border-bottom: 1px solid #dee2e6; }
#status { display: flex; gap: 10px; align-items: center; margin: 20px 0; }
.dot { width: 12px; height: 12px; border-radius: 50%; background: #f44336; }
.dot.online { background: #2ecc71; }
.stats { display: flex; gap: 20px; flex-wrap: wrap; margin-bottom: 20px; }
.stat, .card { background: #fff; border-radius: 8px; padding: 20px; box-shadow: 0 2px 8px rgba(0,0,0,.05); }
body.dark .stat, body.dark .card { background: #333; }
.stat { flex: 1; min-width: 200px; }
.stat p { font-size: 2rem; font-weight: bold; margin: 10px 0 0 0; }
.grid { display: grid; grid-template-columns: repeat(auto-fill, minmax(300px, 1fr)); gap: 20px; }
.row { display: flex; justify-content: space-between; margin: 8px 0; }
.row span:first-child { font-weight: 500; color: #8338ec; }
.ts { font-size: .8rem; color: #777; text-align: right; }
.empty { text-align: center; padding: 40px; }
</style>
</head>
<body>
<div class="container">
  <header>
    <h1>Player Tracker</h1>
    <label><input type="checkbox" id="theme"> Dark mode</label>
  </header>
  <div id="status"><div class="dot" id="dot"></div><span id="status-text">Disconnected</span></div>
  <div class="stats">
    <div class="stat"><h3>Active Players</h3><p id="active">0</p></div>
    <div class="stat"><h3>Unique Games</h3><p id="games">0</p></div>
    <div class="stat"><h3>Last Updated</h3><p id="checked">-</p></div>
  </div>
  <div class="card empty" id="empty">No players connected. Waiting for reports...</div>
  <div class="grid" id="grid"></div>
</div>
<script>
const $ = (id) => document.getElementById(id);

function clock(d) {
  return [d.getHours(), d.getMinutes(), d.getSeconds()]
    .map((n) => String(n).padStart(2, '0')).join(':');
}

function row(card, label, value) {
  const r = document.createElement('div');
  r.className = 'row';
  const k = document.createElement('span');
  k.textContent = label + ':';
  const v = document.createElement('span');
  v.textContent = value;
  r.append(k, v);
  card.appendChild(r);
}

function render(players) {
  $('active').textContent = players.length;
  $('games').textContent = new Set(players.map((p) => p.gameName)).size;
  $('empty').style.display = players.length ? 'none' : '';
  const grid = $('grid');
  grid.replaceChildren();
  for (const p of players) {
    const card = document.createElement('div');
    card.className = 'card';
    const h = document.createElement('h3');
    h.textContent = p.displayName || p.playerName;
    card.appendChild(h);
    row(card, 'Username', p.playerName);
    row(card, 'Game', p.gameName);
    row(card, 'Players', p.serverPlayers + '/' + p.maxPlayers);
    row(card, 'Place ID', p.placeId);
    row(card, 'Job ID', p.jobId);
    row(card, 'Country', p.country);
    row(card, 'Executor', p.executor);
    row(card, 'Version', p.version);
    const ts = document.createElement('div');
    ts.className = 'ts';
    ts.textContent = clock(new Date(p.lastUpdated));
    card.appendChild(ts);
    grid.appendChild(card);
  }
}

function poll() {
  fetch('/server/api/players')
    .then((r) => { if (!r.ok) throw new Error(r.status); return r.json(); })
    .then((players) => {
      $('dot').classList.add('online');
      $('status-text').textContent = 'Connected';
      $('checked').textContent = clock(new Date());
      render(players);
    })
    .catch(() => {
      $('dot').classList.remove('online');
      $('status-text').textContent = 'Connection Error';
    });
}

$('theme').checked = localStorage.getItem('theme') === 'dark';
document.body.classList.toggle('dark', $('theme').checked);
$('theme').addEventListener('change', (e) => {
  document.body.classList.toggle('dark', e.target.checked);
  localStorage.setItem('theme', e.target.checked ? 'dark' : 'light');
});

poll();
setInterval(poll, 5000);
</script>
</body>
</html>
)HTML";

}  // namespace

std::string_view dashboard_html() noexcept {
    return kDashboardHtml;
}

}  // namespace tracker
