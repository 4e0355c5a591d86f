#include <liveview/web/live_http/ClientScript.hpp>

#include <liveview/live/RenderScope.hpp>

#include <nlohmann/json.hpp>

namespace LV::Web {

namespace {

using json = nlohmann::json;

auto script_literal(std::string_view text) -> std::string {
    return Live::escape_script_json(json(std::string{text}).dump());
}

} // namespace

auto build_page_head(std::string_view title) -> std::string {
    std::string head;
    head.reserve(256 + title.size());
    head.append("<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">");
    head.append("<meta http-equiv=\"Cache-Control\" content=\"no-store\">");
    head.append("<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">");
    head.append("<title>");
    head.append(Live::escape_html(title));
    head.append("</title></head><body>\n");
    return head;
}

auto build_page_tail() -> std::string {
    return "\n</body></html>\n";
}

auto build_bootstrap_script(std::string_view context_id, std::string_view live_path, int websocket_port)
    -> std::string {
    std::string script;
    script.reserve(4096);
    script.append("<script id=\"liveview-bootstrap\">(function(){\n");
    script.append("if(window.liveview){return;}\n");
    script.append("var contextId=").append(script_literal(context_id)).append(";\n");
    script.append("var livePath=").append(script_literal(live_path)).append(";\n");
    script.append("var wsPort=").append(std::to_string(websocket_port)).append(";\n");
    script.append("var socket=null;var transport='connecting';var pending=[];\n");
    script.append("function liveUrl(){return livePath+'?id='+encodeURIComponent(contextId);}\n");
    script.append("function findTarget(id){return document.querySelector('[data-lv=\"'+id+'\"]');}\n");
    script.append(
        "function applyAttributes(el,patch){if(patch.encoding==='structured'){var data=patch.payload;"
        "if(!data||typeof data!=='object'){return;}Object.keys(data).forEach(function(name){var value=data[name];"
        "if(value===null||value===false){el.removeAttribute(name);}else{el.setAttribute(name,value===true?'':String(value));}});"
        "return;}var tpl=document.createElement('template');tpl.innerHTML='<div '+(patch.payload||'')+'></div>';"
        "var src=tpl.content.firstChild;if(!src){return;}for(var i=0;i<src.attributes.length;i++){"
        "el.setAttribute(src.attributes[i].name,src.attributes[i].value);}}\n");
    script.append(
        "function applyPatch(patch){if(!patch||patch.target===undefined){return;}var el=findTarget(patch.target);"
        "if(!el){return;}if(patch.mode==='delete'){el.remove();return;}"
        "if(patch.mode==='attribute'){applyAttributes(el,patch);return;}"
        "if(patch.encoding==='structured'){var text=JSON.stringify(patch.payload);"
        "if(patch.mode==='replace'){el.textContent=text;}"
        "el.dispatchEvent(new CustomEvent('liveview:data',{detail:{mode:patch.mode,data:patch.payload},bubbles:true}));return;}"
        "var html=patch.payload||'';if(patch.mode==='append'){el.insertAdjacentHTML('beforeend',html);}"
        "else if(patch.mode==='prepend'){el.insertAdjacentHTML('afterbegin',html);}else{el.innerHTML=html;}}\n");
    script.append(
        "function applyBatch(text){var batch;try{batch=JSON.parse(text);}catch(err){"
        "console.warn('liveview: malformed batch',err);return;}if(!Array.isArray(batch)){return;}"
        "for(var i=0;i<batch.length;i++){applyPatch(batch[i]);}}\n");
    script.append(
        "function postCallback(id,args){fetch(liveUrl(),{method:'POST',headers:{'Content-Type':'application/json'},"
        "body:JSON.stringify([id].concat(args))}).then(function(resp){if(!resp.ok){"
        "console.warn('liveview: callback '+id+' rejected with '+resp.status);}})"
        ".catch(function(err){console.warn('liveview: callback '+id+' failed',err);});}\n");
    script.append(
        "function deliver(id,args){if(socket&&socket.readyState===1){socket.send(String(id)+':'+JSON.stringify(args));return;}"
        "if(transport==='connecting'){pending.push([id,args]);return;}postCallback(id,args);}\n");
    script.append(
        "function flushPending(){var queued=pending;pending=[];for(var i=0;i<queued.length;i++){"
        "deliver(queued[i][0],queued[i][1]);}}\n");
    script.append(
        "function connectEventStream(){transport='event-stream';flushPending();if(!window.EventSource){"
        "console.warn('liveview: no live transport available');return;}var source=new EventSource(liveUrl());"
        "source.onmessage=function(evt){applyBatch(evt.data);};"
        "source.onerror=function(){if(source.readyState===2){transport='closed';}};}\n");
    script.append(
        "function connectWebSocket(){if(!wsPort||!window.WebSocket){connectEventStream();return;}"
        "var scheme=location.protocol==='https:'?'wss://':'ws://';var opened=false;"
        "try{socket=new WebSocket(scheme+location.hostname+':'+wsPort+liveUrl(),'liveview');}"
        "catch(err){socket=null;connectEventStream();return;}"
        "socket.onopen=function(){opened=true;transport='websocket';flushPending();};"
        "socket.onmessage=function(evt){applyBatch(evt.data);};"
        "socket.onclose=function(){socket=null;if(!opened){connectEventStream();}else{transport='closed';}};}\n");
    script.append(
        "window.liveview={contextId:contextId,send:function(id){"
        "deliver(id,Array.prototype.slice.call(arguments,1));},transport:function(){return transport;}};\n");
    script.append("connectWebSocket();\n");
    script.append("})();</script>\n");
    return script;
}

} // namespace LV::Web
